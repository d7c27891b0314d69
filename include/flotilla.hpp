#pragma once

// Single-include convenience header for flotilla.

#include "flotilla/error.hpp"
#include "flotilla/model/movement_log.hpp"
#include "flotilla/model/unit.hpp"
#include "flotilla/registry.hpp"
#include "flotilla/reports/archive.hpp"
#include "flotilla/reports/movement_orders.hpp"
#include "flotilla/reports/sensor_faults.hpp"
#include "flotilla/serial.hpp"
#include "flotilla/types.hpp"
