export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Error;
export import :Logging;
export import :Profiling;
export import :Hash;
export import :Filesystem;
export import :Lease;
export import :RetireQueue;
