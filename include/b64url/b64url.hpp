#pragma once

// Main public API - include all headers
#include "b64url/b64url_constants.hpp"
#include "b64url/errors.hpp"
#include "b64url/codec.hpp"
#include "b64url/dispatch.hpp"
