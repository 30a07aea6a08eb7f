#include "execution_gate.h"

namespace TraceDiff {

ExecutionGate& ExecutionGate::Global() {
    static ExecutionGate instance;
    return instance;
}

} // namespace TraceDiff
