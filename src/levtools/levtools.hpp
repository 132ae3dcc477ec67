#pragma once

#include "config.hpp"
#include "distance.hpp"
#include "editops.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "median.hpp"
#include "sequence.hpp"
#include "set_distance.hpp"
