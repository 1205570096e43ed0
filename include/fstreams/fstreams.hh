/**
 * @file fstreams.hh
 * @brief Everything needed to register handlers and open formatted streams
 */

#ifndef FSTREAMS_FSTREAMS_HH
#define FSTREAMS_FSTREAMS_HH

#include <fstreams/error.hh>
#include <fstreams/sdk/capability.hh>
#include <fstreams/sdk/formatted_stream.hh>
#include <fstreams/sdk/handler.hh>
#include <fstreams/sdk/io_stream.hh>
#include <fstreams/sdk/open_options.hh>
#include <fstreams/sdk/types.hh>
#include <fstreams/registry.hh>
#include <fstreams/dispatcher.hh>
#include <fstreams/coding_registry.hh>
#include <fstreams/classifier.hh>
#include <fstreams/resource.hh>
#include <fstreams/resolver.hh>
#include <fstreams/session.hh>
#include <fstreams/iteration.hh>
#include <fstreams/export_fstreams.h>

namespace fstreams {
    /**
     * @brief Library version, "major.minor.patch"
     */
    FSTREAMS_EXPORT const char* version();
}

#endif // FSTREAMS_FSTREAMS_HH
