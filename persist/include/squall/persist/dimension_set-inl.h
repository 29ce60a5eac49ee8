#ifndef SQUALL_PERSIST_DIMENSION_SET_INL_H
#define SQUALL_PERSIST_DIMENSION_SET_INL_H

namespace squall {
namespace persist {


template<typename Iter>
dimension_set::dimension_set(Iter b, Iter e)
: names_(b, e)
{
  validate_();
}


}} /* namespace squall::persist */

#endif /* SQUALL_PERSIST_DIMENSION_SET_INL_H */
