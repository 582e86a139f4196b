#include "signalflow/signalflow.h"

#include <arrow/compute/initialize.h>

namespace signalflow {

arrow::Status initialize() {
    return arrow::compute::Initialize();
}

} // namespace signalflow
