#pragma once

// Main include file for h2wire

// Utilities
#include "h2wire/util/expected.hpp"

// Core
#include "h2wire/core/config.hpp"
#include "h2wire/core/error.hpp"
#include "h2wire/core/logging.hpp"

// Network
#include "h2wire/net/byte_stream.hpp"
#include "h2wire/net/socket.hpp"

// HTTP/2
#include "h2wire/http2/connection.hpp"
#include "h2wire/http2/frame.hpp"
#include "h2wire/http2/hpack.hpp"
#include "h2wire/http2/preface.hpp"
#include "h2wire/http2/response.hpp"
#include "h2wire/http2/settings.hpp"
#include "h2wire/http2/stream.hpp"

// Server
#include "h2wire/server/server.hpp"
