#include "storenamegenerator.hpp"

#include <cstdint>
#include <iomanip>
#include <locale>
#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace chunkstore::store
{
namespace
{
constexpr char const *name_prefix      = "store";
constexpr char const *timestamp_format = "%Y%m%d.%H%M%S.%f";
}  // namespace

std::string StoreNameGenerator::next_name()
{
    namespace pt = boost::posix_time;

    std::ostringstream ss;

    // The locale takes ownership of the facet
    ss.imbue(std::locale {ss.getloc(), new pt::time_facet {timestamp_format}});
    ss << name_prefix << '.' << pt::microsec_clock::universal_time() << '.' << std::hex
       << std::setw(8) << std::setfill('0') << rng_.next<uint32_t>();

    return ss.str();
}
}  // namespace chunkstore::store
