#include "profiler.h"

Profiler profiler;
