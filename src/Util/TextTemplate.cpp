#include "Util/TextTemplate.h"
#include "Util/DirectorErrors.h"

#include <fmt/args.h>
#include <fmt/format.h>

std::string RenderTemplate(std::string const& text, TemplateSlots const& slots)
{
    // Named arguments resolved at runtime; fmt rejects any placeholder without a value.
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (auto const& slot : slots)
    {
        store.push_back(fmt::arg(slot.first.c_str(), slot.second));
    }

    try
    {
        return fmt::vformat(text, store);
    }
    catch (fmt::format_error const& ex)
    {
        throw TemplatingError("template '" + text + "': " + ex.what());
    }
}
