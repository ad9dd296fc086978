#pragma once

namespace hoststate {

// Sections of a state document that the System Observer can produce.
// "notes" is user-authored and deliberately absent here.
enum class StateCategory {
    System,
    Hardware,
    Network,
    Software,
    Services,
    Gaming
};

enum class StateAction {
    Load,
    Save,
    Update,
    Compare,
    Export,
    Import,
    Diff,
    Watch
};

enum class ErrorCode {
    NotFound,
    SchemaError,
    CorruptionError,
    ValidationError,
    IoError,
    LockTimeout,
    ObserverError,
    Cancelled
};

} // namespace hoststate
