#ifndef FERRY_HANDOFF_HANDOFF_ERROR_HPP
#define FERRY_HANDOFF_HANDOFF_ERROR_HPP

#include <boost/system/error_code.hpp>

namespace ferry {
namespace handoff {

//! Error conditions of the handoff manager & its transfer units
/*!
    A default-constructed boost::system::error_code denotes normal
    completion of a transfer.
*/
enum errc
{
    //! the handoff concurrency limit is reached, or was lowered
    max_concurrency = 1,

    //! a supervisor failed to start a transfer unit
    spawn_failed,

    //! a transfer unit failed while running
    transfer_failed,

    //! a transfer unit was destroyed without reporting an exit
    transfer_lost,

    //! the handoff manager is shutting down
    shutting_down
};

const boost::system::error_category & handoff_category();

inline boost::system::error_code make_error_code(errc e)
{
    return boost::system::error_code(static_cast<int>(e), handoff_category());
}

}
}

namespace boost {
namespace system {

template<>
struct is_error_code_enum<ferry::handoff::errc>
{
    static const bool value = true;
};

}
}

#endif

