#include "Ai/Collaborators.h"
#include "Util/DirectorLog.h"

void EmitEvent(EventSink* sink, EventRecord const& record, char const* category)
{
    if (!sink)
    {
        return;
    }

    try
    {
        sink->SaveEvent(record);
    }
    catch (std::exception const& ex)
    {
        DIRECTOR_LOG_WARN(category, "[EventSink] Dropped {} for session {}: {}",
                          record.eventType, record.sessionId, ex.what());
    }
}
