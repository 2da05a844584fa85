#pragma once

#include "field_descriptor.hpp"
#include "errors.hpp"
#include "type_registry.hpp"
#include "descriptor_builder.hpp"
