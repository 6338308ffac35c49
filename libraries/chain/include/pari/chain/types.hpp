#pragma once

#include <pari/chain/config.hpp>

#include <fc/array.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/io/enum_type.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace pari { namespace chain {

    typedef fc::ripemd160               address_type;
    typedef fc::ripemd160               transaction_id_type;
    typedef fc::sha256                  digest_type;
    typedef uint64_t                    share_type;
    typedef uint64_t                    epoch_type;
    typedef uint64_t                    tick_type;
    typedef uint8_t                     tier_id_type;
    typedef uint16_t                    fee_bps_type;
    typedef uint16_t                    selection_mask_type;

    typedef fc::array<share_type, PARI_NUMBER_COUNT>       per_number_values;
    typedef fc::array<uint32_t, PARI_NUMBER_COUNT>         per_number_counts;
    typedef fc::array<char, PARI_RESULTS_POINTER_SIZE>     results_pointer_type;

    using std::string;
    using std::function;
    using fc::variant;
    using fc::variant_object;
    using fc::mutable_variant_object;
    using fc::optional;
    using std::map;
    using std::set;
    using std::vector;
    using std::pair;
    using std::shared_ptr;
    using std::unique_ptr;
    using fc::sha256;
    using fc::time_point_sec;

    /** owner names map to addresses by hashing, the host attests which addresses signed */
    address_type make_address( const string& owner_name );

    results_pointer_type make_results_pointer( const string& uri );
    string results_pointer_to_string( const results_pointer_type& pointer );
    bool is_empty_results_pointer( const results_pointer_type& pointer );

    per_number_values zero_per_number_values();
    per_number_counts zero_per_number_counts();

} } // pari::chain
