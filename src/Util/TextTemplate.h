#pragma once

#include <map>
#include <string>

using TemplateSlots = std::map<std::string, std::string>;

// Fill "{slot}" placeholders from `slots`. Throws TemplatingError when a
// placeholder has no value or the template itself is malformed.
std::string RenderTemplate(std::string const& text, TemplateSlots const& slots);
