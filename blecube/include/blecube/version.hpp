#pragma once

#define BLECUBE_VERSION "1.0.0"
#define BLECUBE_VERSION_MAJOR 1
#define BLECUBE_VERSION_MINOR 0
