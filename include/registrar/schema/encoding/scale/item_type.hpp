#pragma once

#include <registrar/schema/item_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(registrar::schema,
                             item_type_t,
                             registrar::schema::item_type_t::passport,
                             registrar::schema::item_type_t::visa,
                             registrar::schema::item_type_t::aid_kit,
                             registrar::schema::item_type_t::document)
