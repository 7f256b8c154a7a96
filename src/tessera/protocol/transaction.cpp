#include <tessera/protocol/transaction.hpp>

#include <algorithm>

namespace tessera::protocol {

bool transaction::validate() const noexcept
{
  if( !payer.user() )
    return false;

  if( nonce == 0 )
    return false;

  if( operations.empty() )
    return false;

  return std::ranges::all_of( operations,
                              []( const operation& op )
                              {
                                return std::visit(
                                  []( const auto& o )
                                  {
                                    return o.validate();
                                  },
                                  op );
                              } );
}

} // namespace tessera::protocol
