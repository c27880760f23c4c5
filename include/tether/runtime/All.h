/***
 * Name: tether::rt (aggregate header)
 * Purpose: Convenience include for the whole runtime API.
 */
#pragma once

#include "tether/runtime/Runtime.h"
#include "tether/runtime/GC.h"
#include "tether/runtime/GCStats.h"
#include "tether/runtime/Threads.h"
#include "tether/runtime/TypeTag.h"
