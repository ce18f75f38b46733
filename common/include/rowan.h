#ifndef __ROWAN_CORE__
#define __ROWAN_CORE__

#include "errors.h"
#include "filterSpec.h"
#include "windowDesc.h"

#endif
