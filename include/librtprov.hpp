#pragma once

#include "librtprov/export.hpp"
#include "librtprov/fwd.hpp"
#include "librtprov/type.hpp"
#include "librtprov/class_info.hpp"
#include "librtprov/annotations.hpp"
#include "librtprov/type_utils.hpp"
#include "librtprov/exceptions.hpp"
#include "librtprov/logging.hpp"
#include "librtprov/descriptor.hpp"
#include "librtprov/provides_descriptor.hpp"
#include "librtprov/configuration.hpp"
#include "librtprov/service_handle.hpp"
#include "librtprov/service_locator.hpp"
#include "librtprov/locator.hpp"
#include "librtprov/providers_seen.hpp"
#include "librtprov/provides_listener.hpp"
#include "librtprov/provides_enabler.hpp"
