#ifndef ARBOR_ARBOR_H
#define ARBOR_ARBOR_H

#include "common.h"
#include "comparator.h"
#include "database.h"
#include "options.h"
#include "slice.h"
#include "status.h"

#endif // ARBOR_ARBOR_H
