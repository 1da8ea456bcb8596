#pragma once

#include "types.h"
#include "object.h"
#include "factory.h"
#include "event.h"
#include "event-listener.h"
#include "event-loop.h"
