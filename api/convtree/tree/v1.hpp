#pragma once

// Public protobuf surface of the conversation tree engine.

#include "convtree/tree/v1/message.pb.h"
#include "convtree/tree/v1/tree_service.pb.h"

#include <google/protobuf/empty.pb.h>
#include <google/protobuf/struct.pb.h>
