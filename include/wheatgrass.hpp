#pragma once

#include "wheatgrass/export.hpp"
#include "wheatgrass/fwd.hpp"
#include "wheatgrass/type_traits.hpp"
#include "wheatgrass/key.hpp"
#include "wheatgrass/logging.hpp"
#include "wheatgrass/provider.hpp"
#include "wheatgrass/binding.hpp"
#include "wheatgrass/exceptions.hpp"
#include "wheatgrass/context.hpp"
#include "wheatgrass/injector.hpp"
#include "wheatgrass/members.hpp"
#include "wheatgrass/root_injector_builder.hpp"
