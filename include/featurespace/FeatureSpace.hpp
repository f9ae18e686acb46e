#pragma once

#include "core/Conformance.hpp"
#include "core/Error.hpp"
#include "collection/IdentifiedArray.hpp"
#include "debug/PrintChanges.hpp"
#include "effect/CancellationId.hpp"
#include "effect/CancellationRegistry.hpp"
#include "effect/CancellationToken.hpp"
#include "effect/Effect.hpp"
#include "identity/Identity.hpp"
#include "identity/IdentityRegistry.hpp"
#include "observation/ObservableState.hpp"
#include "observation/ObservationRegistrar.hpp"
#include "observation/ObservationTracking.hpp"
#include "observation/Observer.hpp"
#include "observation/TrackedField.hpp"
#include "reducer/CaseReducer.hpp"
#include "reducer/Combine.hpp"
#include "reducer/ForEach.hpp"
#include "reducer/Paths.hpp"
#include "reducer/Presentation.hpp"
#include "reducer/Reducer.hpp"
#include "scope/CaseScope.hpp"
#include "scope/CaseState.hpp"
#include "store/Store.hpp"
#include "store/StoreOptions.hpp"
#include "store/ViewAction.hpp"
#include "task/Executor.hpp"
#include "task/Task.hpp"
#include "task/TaskPool.hpp"
