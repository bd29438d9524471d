#pragma once

#include "chatrelay/v1/control.pb.h"
#include "chatrelay/v1/envelope.pb.h"
#include "chatrelay/v1/profile.pb.h"

#include "chatrelay/protocol/v1/commands.pb.h"
#include "chatrelay/protocol/v1/events.pb.h"
