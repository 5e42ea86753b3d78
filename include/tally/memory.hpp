#pragma once

#include <tally/memory/memory.hpp>
