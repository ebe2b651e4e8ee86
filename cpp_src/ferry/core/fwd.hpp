#ifndef FERRY_CORE_FWD_HPP
#define FERRY_CORE_FWD_HPP

#include <boost/asio/io_service.hpp>
#include <memory>

namespace ferry {
namespace core {

class proactor;
typedef std::shared_ptr<proactor> proactor_ptr_t;

typedef std::shared_ptr<boost::asio::io_service> io_service_ptr_t;
typedef std::shared_ptr<boost::asio::io_service::work> io_work_ptr_t;

}
}

#endif
