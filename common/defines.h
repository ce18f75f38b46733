#ifndef __ROWAN_DEFINES__
#define __ROWAN_DEFINES__

#ifndef M_PI
#define M_PI 3.14159265358979323846264338327950288
#endif

// Largest order a designer will synthesize
#define MAX_FILTER_ORDER 128

#endif
