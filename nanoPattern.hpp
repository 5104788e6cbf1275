#include <cassert>
#include <cstddef>
#include <array>
#include <stdexcept>
#include <string_view>
#ifndef NANOPATTERN_HPP
#define NANOPATTERN_HPP
namespace NanoPattern{
    // Thrown when a pattern is built outside its capacity contract.
    // In a constant expression the throw becomes a compile error.
    struct pattern_exception:public std::invalid_argument{using std::invalid_argument::invalid_argument;};

    // Half-open byte range [begin,end) into the input passed to match().
    struct MatchGroup{
        std::size_t begin;
        std::size_t end;
        constexpr MatchGroup():begin(0),end(0){}
        constexpr MatchGroup(std::size_t b,std::size_t e):begin(b),end(e){assert(b<=e);}
        constexpr std::size_t length()const{return end-begin;}
        constexpr MatchGroup shifted(std::size_t offset)const{return MatchGroup(begin+offset,end+offset);}
        constexpr std::string_view text(const char*input)const{return std::string_view(input+begin,end-begin);}
    };
    constexpr bool operator==(const MatchGroup&a,const MatchGroup&b){return a.begin==b.begin&&a.end==b.end;}
    constexpr bool operator!=(const MatchGroup&a,const MatchGroup&b){return !(a==b);}

    // Result of one match attempt. Only the first groupsMatched groups are meaningful,
    // groups[0] is the whole consumed span. groupsMatched==0 iff bytesConsumed==0.
    template<std::size_t N>struct Match{
        static_assert(N>0,"pattern capacity must be positive");
        std::size_t bytesConsumed;
        std::size_t groupsMatched;
        std::array<MatchGroup,N>groups;
        constexpr Match():bytesConsumed(0),groupsMatched(0),groups(){}
        constexpr Match(std::size_t consumed,std::size_t matched,const std::array<MatchGroup,N>&g)
            :bytesConsumed(consumed),groupsMatched(matched),groups(g){
            assert(matched<=N);
            assert((matched==0)==(consumed==0));
        }
        constexpr static Match empty(){return Match();}
        constexpr bool matched()const{return groupsMatched!=0;}
        constexpr std::string_view text(const char*input,std::size_t idx)const{
            assert(idx<groupsMatched);
            return groups[idx].text(input);
        }
    };
    template<std::size_t N>constexpr bool operator==(const Match<N>&a,const Match<N>&b){
        if(a.bytesConsumed!=b.bytesConsumed||a.groupsMatched!=b.groupsMatched){return false;}
        for(std::size_t i=0;i<a.groupsMatched;i++){if(a.groups[i]!=b.groups[i]){return false;}}
        return true;
    }
    template<std::size_t N>constexpr bool operator!=(const Match<N>&a,const Match<N>&b){return !(a==b);}

    template<std::size_t N>struct Wildcard;
    template<std::size_t N>struct Character;
    template<std::size_t N>struct CharacterClass;
    template<std::size_t N>struct InvertedCharacterClass;
    template<std::size_t N>struct Concatenation;
    template<std::size_t N>struct Group;
    template<std::size_t N>struct Optional;
    template<std::size_t N>struct Pattern;
}
#endif
