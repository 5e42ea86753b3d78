#pragma once

#include <tally/log/log.hpp>
