#pragma once

#include "notemarker/client.h"
#include "notemarker/comments.h"
#include "notemarker/compatibility.h"
#include "notemarker/errors.h"
#include "notemarker/log.h"
#include "notemarker/message_builder.h"
#include "notemarker/protocol.h"
#include "notemarker/time_format.h"
#include "notemarker/transport.h"
