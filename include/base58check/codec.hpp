#pragma once

#include <base58check/codec/codec.hpp>
#include <base58check/codec/error.hpp>
