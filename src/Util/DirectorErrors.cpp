#include "Util/DirectorErrors.h"

char const* FailureKindName(FailureKind kind)
{
    switch (kind)
    {
        case FailureKind::Validation:
            return "validation";
        case FailureKind::Collaborator:
            return "collaborator";
        case FailureKind::Templating:
            return "templating";
    }
    return "unknown";
}
