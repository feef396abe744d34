#pragma once

#include <base58check/crypto/checksum.hpp>
#include <base58check/crypto/hash.hpp>
