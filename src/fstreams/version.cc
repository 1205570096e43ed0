#include <fstreams/fstreams.hh>
#include <fstreams/fstreams_config.h>

namespace fstreams {

    const char* version() {
        return FSTREAMS_VERSION_STRING;
    }

}
