#include <squall/persist/persist_exception.h>

namespace squall {
namespace persist {


persist_exception::~persist_exception() {}


}} /* namespace squall::persist */
