// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <graphser/errors.h>
#include <graphser/type_template.h>

namespace graphser {

TemplateField::TemplateField(Value k, Template sub)
    : key(std::move(k)), nested(std::make_shared<const Template>(std::move(sub))) {}

Template::Template(std::initializer_list<TemplateField> fields)
    : fields_(fields)
{
    index_keys();
}

Template::Template(std::vector<TemplateField> fields)
    : fields_(std::move(fields))
{
    index_keys();
}

void Template::index_keys()
{
    keys_.reserve(fields_.size());
    for (const auto& field : fields_) {
        if (!is_valid_key(field.key)) {
            throw InvalidKey("template field key cannot be " + std::string(type_name_of(field.key)) +
                             (field.key.is_nil() ? "" : " NaN"));
        }
        if (!keys_.insert(field.key).second) {
            throw InvalidKey("duplicate template field " + to_string(field.key));
        }
    }
}

} // namespace graphser
