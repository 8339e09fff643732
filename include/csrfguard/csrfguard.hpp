#pragma once

/**
 * @file csrfguard.hpp
 * @brief Main header for the csrfguard library
 *
 * Include this header to access the request guard, the token manager and
 * the in-memory request, response and session implementations.
 */

// Core components
#include "core/base.hpp"
#include "core/config.hpp"

// Utility components
#include "utils/logging.hpp"
#include "utils/url.hpp"

// Collaborator interfaces
#include "http/request.hpp"
#include "http/response.hpp"
#include "session/session.hpp"

// CSRF protection
#include "security/crypto.hpp"
#include "security/token_manager.hpp"
#include "security/request_guard.hpp"
#include "security/middleware.hpp"

/**
 * @namespace csrfguard
 * @brief Cross-site request forgery protection for HTTP request pipelines
 */
namespace csrfguard {}
