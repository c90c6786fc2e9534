#pragma once

#define MEDIAGATE_VERSION_MAJOR 1
#define MEDIAGATE_VERSION_MINOR 2
#define MEDIAGATE_VERSION_PATCH 0
#define MEDIAGATE_VERSION "1.2.0"
