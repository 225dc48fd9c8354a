#pragma once

#include "scopedi/export.hpp"
#include "scopedi/fwd.hpp"
#include "scopedi/lifetime.hpp"
#include "scopedi/options.hpp"
#include "scopedi/logging.hpp"
#include "scopedi/binding_key.hpp"
#include "scopedi/type_traits.hpp"
#include "scopedi/erased_instance.hpp"
#include "scopedi/binding.hpp"
#include "scopedi/exceptions.hpp"
#include "scopedi/plan.hpp"
#include "scopedi/scope.hpp"
#include "scopedi/injector.hpp"
#include "scopedi/registry.hpp"
