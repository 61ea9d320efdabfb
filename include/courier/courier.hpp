#pragma once

// Core types
#include "courier/core/cancellation.hpp"
#include "courier/core/config.hpp"
#include "courier/core/future.hpp"
#include "courier/core/types.hpp"

// Network
#include "courier/net/connection_pool.hpp"
#include "courier/net/headers.hpp"
#include "courier/net/multipart.hpp"
#include "courier/net/params.hpp"
#include "courier/net/url.hpp"

// HTTP
#include "courier/http/redirect.hpp"
#include "courier/http/request.hpp"
#include "courier/http/response.hpp"

// Client
#include "courier/client/client.hpp"
#include "courier/event/event_loop.hpp"
#include "courier/log/log.h"

namespace courier {

// Get version string
std::string version();

}  // namespace courier
