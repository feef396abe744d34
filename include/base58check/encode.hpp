#pragma once

#include <base58check/encode/alphabet.hpp>
#include <base58check/encode/base58.hpp>
#include <base58check/encode/error.hpp>
#include <base58check/encode/hex.hpp>
