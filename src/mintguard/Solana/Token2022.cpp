#include "mintguard/Solana/Token2022.hpp"

namespace Mintguard
{
namespace Solana
{

namespace
{

void apply_extension( MintFacts & facts, uint16_t extensionType, std::span< const std::byte > payload )
{
    switch ( static_cast< ExtensionType >( extensionType ) )
    {
        case ExtensionType::MetadataAccount:
        {
            if ( payload.size( ) < Core::PublicKey::size )
            {
                facts.parseFail = true;
                break;
            }
            auto address = Core::PublicKey::from_bytes( payload.first( Core::PublicKey::size ) );
            // An all-zero address is the encoding of "no pointer".
            if ( !facts.metadataPointer && address && !address->is_zero( ) )
            {
                facts.metadataPointer = address;
            }
            break;
        }
        case ExtensionType::UpdateAuthority:
        {
            if ( !payload.empty( ) )
            {
                facts.updateAuthorityPresent = payload[ 0 ] != std::byte{ 0 };
            }
            break;
        }
        default:
        {
            break;
        }
    }
}

} // namespace

MintFacts decode_token2022_mint( std::span< const std::byte > data )
{
    ByteCursor cursor( data );

    auto baseMint = read_base_mint( cursor );
    MintFacts facts = baseMint.value_or( MintFacts{ } );
    facts.isToken2022 = true;

    if ( !baseMint )
    {
        facts.parseFail = true;
        return facts;
    }

    // A mint without extensions keeps the legacy length.
    if ( data.size( ) == MintFacts::size( ) )
    {
        return facts;
    }

    if ( !cursor.skip( token_2022_account_type_offset( ) - MintFacts::size( ) ) )
    {
        facts.parseFail = true;
        return facts;
    }

    auto accountType = cursor.read_u8( );
    if ( !accountType || *accountType != static_cast< uint8_t >( Token2022AccountType::Mint ) )
    {
        facts.parseFail = true;
        return facts;
    }

    while ( cursor.remaining( ) >= 2 * sizeof( uint16_t ) )
    {
        auto extensionType = cursor.read_u16( );
        auto length = cursor.read_u16( );
        auto payload = cursor.read_bytes( *length );
        if ( !payload )
        {
            facts.parseFail = true;
            break;
        }

        if ( *extensionType != static_cast< uint16_t >( ExtensionType::Uninitialized ) )
        {
            facts.foundExtension = true;
        }
        apply_extension( facts, *extensionType, *payload );
    }

    return facts;
}

} // namespace Solana
} // namespace Mintguard
