#pragma once
#include <string>

namespace FS {

struct Executor;

struct StoreOptions {
    // Where effects run; nullptr selects TaskPool::Instance().
    Executor*   executor = nullptr;
    std::string name     = "Store";
};

} // namespace FS
