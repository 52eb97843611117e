#pragma once

#include "brokerstore/persistence/v1/records.pb.h"

namespace brokerstore::v1 {
using namespace ::brokerstore::persistence::v1;
}
