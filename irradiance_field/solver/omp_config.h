// omp_config.h: OpenMP switch

#pragma once

#if defined(_OPENMP)
#include <omp.h>
#define IRRADIANCE_OMP_ENABLED 1
#else
#define IRRADIANCE_OMP_ENABLED 0

// Minimal stand-ins so the accumulation code compiles without OpenMP
inline int omp_get_max_threads() { return 1; }
inline int omp_get_num_threads() { return 1; }
#endif
