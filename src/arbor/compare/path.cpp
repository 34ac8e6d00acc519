#include <arbor/compare/path.hpp>

#include <sstream>

namespace arbor {

string
format_value_path(value_path const& path)
{
    std::ostringstream os;
    bool at_root = true;
    for (auto const& element : path)
    {
        switch (element.type())
        {
            case value_type::STRING:
                if (!at_root)
                    os << '.';
                os << cast<string>(element);
                break;
            case value_type::INTEGER:
                if (cast<integer>(element) < 0)
                {
                    ARBOR_THROW(
                        invalid_path_element() << path_element_info(element));
                }
                os << '[' << cast<integer>(element) << ']';
                break;
            case value_type::NIL:
            case value_type::BOOLEAN:
            case value_type::FLOAT:
            case value_type::DATETIME:
            case value_type::RECORD:
            case value_type::ARRAY:
            case value_type::MAP:
                ARBOR_THROW(
                    invalid_path_element() << path_element_info(element));
        }
        at_root = false;
    }
    return os.str();
}

} // namespace arbor
