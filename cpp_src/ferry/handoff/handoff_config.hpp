#ifndef FERRY_HANDOFF_HANDOFF_CONFIG_HPP
#define FERRY_HANDOFF_HANDOFF_CONFIG_HPP

#include "ferry/core/protobuf/ferry.pb.h"
#include <string>

namespace ferry {
namespace handoff {

namespace spb = ferry::core::protobuf;

//! Validated handoff manager configuration
/*!
    Built from a protobuf HandoffConfig description, which is typically
    written in protobuf text format:

        handoff_concurrency: 2
        exclusion { module: "kv" partition: 42 }

    Throws ferry::error::ferry_exception if the description is malformed.
*/
class handoff_config
{
public:

    /// Default configuration: concurrency of 1, and no exclusions
    handoff_config();

    handoff_config(const spb::HandoffConfig &);

    static handoff_config from_text(const std::string & text);

    static handoff_config from_file(const std::string & path);

    unsigned get_handoff_concurrency() const
    { return _desc.handoff_concurrency(); }

    const spb::HandoffConfig & get_protobuf_description() const
    { return _desc; }

private:

    void validate() const;

    spb::HandoffConfig _desc;
};

}
}

#endif

