#include <qx/exception.hpp>

#include <ostream>

namespace qx
{

std::ostream& operator<<(std::ostream& out, const status_code& status)
{
    return out << status.category_name() << "::" << status.message() << "(" << status.code() << ")";
}

std::ostream& operator<<(std::ostream& out, const error_desc& desc)
{
    out << desc.status();
    if (*desc.what() != '\0')
        out << " " << desc.what();
    return out;
}

std::ostream& operator<<(std::ostream& out, const exception& exc)
{
    return out << exc.err();
}

}  // namespace qx
