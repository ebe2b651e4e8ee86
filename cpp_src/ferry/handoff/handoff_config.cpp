#include "ferry/handoff/handoff_config.hpp"
#include "ferry/error.hpp"
#include "ferry/log.hpp"
#include <google/protobuf/text_format.h>
#include <fstream>
#include <sstream>

namespace ferry {
namespace handoff {

handoff_config::handoff_config()
{ }

handoff_config::handoff_config(const spb::HandoffConfig & desc)
 : _desc(desc)
{
    validate();
}

handoff_config handoff_config::from_text(const std::string & text)
{
    spb::HandoffConfig desc;

    FERRY_ASSERT_MSG(google::protobuf::TextFormat::ParseFromString(
        text, &desc), "malformed HandoffConfig");

    return handoff_config(desc);
}

handoff_config handoff_config::from_file(const std::string & path)
{
    std::ifstream in(path.c_str());
    FERRY_ASSERT_MSG(in.is_open(), "failed to open " + path);

    std::stringstream text;
    text << in.rdbuf();

    LOG_INFO("loading handoff configuration from " << path);
    return from_text(text.str());
}

void handoff_config::validate() const
{
    FERRY_ASSERT_MSG(_desc.IsInitialized(),
        _desc.InitializationErrorString());

    for(const spb::HandoffConfig::Exclusion & excl : _desc.exclusion())
    {
        FERRY_ASSERT_MSG(!excl.module().empty(),
            "exclusion of partition without a module");
    }
}

}
}

