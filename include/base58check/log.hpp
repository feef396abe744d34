#pragma once

#include <base58check/log/log.hpp>
