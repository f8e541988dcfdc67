#include <errata/error_exception.hpp>

#include <new>

namespace errata
{
auto error_exception::what() const noexcept -> char const *
{
    if (mErrDesc.empty())
    {
        try
        {
            mErrDesc = mErr.diagnostic_information(
                    error_message_format::with_diagnostics);
        }
        catch (std::bad_alloc const &)
        {
            return "<error_exception|failed to allocate the diagnostic "
                   "information string>";
        }
        catch (...)
        {
            return "<error_exception|failed to retrieve the diagnostic "
                   "information from the error>";
        }
    }
    return mErrDesc.c_str();
}
} // namespace errata
