#pragma once

#include <base58check/memory/memory.hpp>
