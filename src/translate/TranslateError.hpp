#pragma once

namespace translate
{
    enum class TranslateError
    {
        None = 0,
        UnsupportedLanguage, // source or target not in the catalog
        InvalidTarget,       // target is the auto-detect sentinel
        IpBanned,            // the service answered with an error status
        TransportError,      // no usable HTTP response
        ParseError,          // body is not a positional JSON array
        NotReady             // job queue not initialized
    };

    const char* toString(TranslateError error);
}
