#pragma once

#include <provenance/schema/admin_operation.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    provenance::schema,
    admin_operation,
    provenance::schema::admin_operation::register_verifier,
    provenance::schema::admin_operation::set_verifier_active,
    provenance::schema::admin_operation::register_device,
    provenance::schema::admin_operation::set_device_active,
    provenance::schema::admin_operation::update_registry)
