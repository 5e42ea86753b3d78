#pragma once

#include <tally/controller/controller.hpp>
#include <tally/controller/error.hpp>
#include <tally/controller/execution_context.hpp>
