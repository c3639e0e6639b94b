#pragma once

#define MCPMUX_VERSION_MAJOR 0
#define MCPMUX_VERSION_MINOR 1
#define MCPMUX_VERSION_PATCH 0
#define MCPMUX_VERSION_STRING "0.1.0"
