#pragma once

#include <base58check/version/error.hpp>
#include <base58check/version/registry.hpp>
