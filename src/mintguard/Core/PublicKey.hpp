#pragma once

#include <boost/functional/hash.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace Mintguard
{
namespace Core
{

// 32-byte hash.
class Hash
{
public:
    static constexpr size_t size = 32;

    Hash( ) = default;
    Hash( const Hash & ) = default;
    Hash & operator=( const Hash & ) = default;

    explicit Hash( const std::array< std::byte, size > & data ) : _hash( data ) { }

    bool operator==( const Hash & ) const = default;
    bool operator!=( const Hash & ) const = default;

    bool is_zero( ) const;

    std::string enc_base58_text( ) const;
    bool init_from_base58( std::string_view text );

    std::array< std::byte, size > & data( ) & { return _hash; }
    const std::array< std::byte, size > & data( ) const & { return _hash; }

    friend std::ostream & operator <<( std::ostream & o, const Hash & binaryHash );

protected:
    std::array< std::byte, size > _hash{ };
};
static_assert( sizeof( Hash ) == 32, "Invalid Hash size" );

// Public key, account address or program id.
class PublicKey : public Hash
{
public:
    using Hash::Hash;

    // Throws MintguardError if text is not a base58-encoded 32-byte key.
    static PublicKey from_base58( std::string_view text );

    // Copies exactly size bytes, std::nullopt on any other length.
    static std::optional< PublicKey > from_bytes( std::span< const std::byte > bytes );
};
static_assert( sizeof( PublicKey ) == 32, "Invalid PublicKey size" );

inline std::size_t hash_value( Mintguard::Core::PublicKey const & key )
{
    return boost::hash_value( key.data( ) );
}

} // namespace Core
} // namespace Mintguard

template< >
struct std::hash< Mintguard::Core::PublicKey >
{
    std::size_t operator( )( const Mintguard::Core::PublicKey & key ) const noexcept
    {
        return boost::hash_value( key.data( ) );
    }
};

namespace fmt
{

template < >
struct formatter< Mintguard::Core::PublicKey > : fmt::formatter< std::string >
{
    // parse is inherited from formatter<string>.
    template < class FormatContext >
    auto format( const Mintguard::Core::PublicKey & key, FormatContext & ctx ) const
    {
        return fmt::formatter< std::string >::format( key.enc_base58_text( ), ctx );
    }
};

} // namespace fmt
