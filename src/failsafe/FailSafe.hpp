#ifndef INC_FAILSAFE_FAILSAFE_HPP
#define INC_FAILSAFE_FAILSAFE_HPP

#include <failsafe/config/Config.hpp>
#include <failsafe/config/Environment.hpp>
#include <failsafe/util/Log.hpp>

#include "Error.hpp"
#include "Value.hpp"
#include "Scope.hpp"
#include "AttachmentFilter.hpp"
#include "codec/SnapshotCodec.hpp"
#include "store/Store.hpp"
#include "store/LocalFile.hpp"
#include "store/Memory.hpp"
#include "scope/MapScope.hpp"
#include "scope/ReferenceScope.hpp"
#include "session/CheckpointSession.hpp"

#endif  // INC_FAILSAFE_FAILSAFE_HPP
