// Fuzz target for the matcher: every variant and a nested tree against
// arbitrary bytes. Build with -DNANOPATTERN_BUILD_FUZZERS=ON using clang.
#include "nanoPattern.hpp"
#include "cx.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
using namespace NanoPattern;
namespace{
    constexpr std::size_t CAPACITY=8;
    using P=Pattern<CAPACITY>;
    constexpr P a=Character<CAPACITY>('a');
    constexpr P b=Character<CAPACITY>('b');
    constexpr P any=Wildcard<CAPACITY>{};
    constexpr P digit=CharacterClass<CAPACITY>("01234567");
    constexpr P notSpace=InvertedCharacterClass<CAPACITY>(" \t\r\n");
    constexpr P groupB=Group<CAPACITY>(&b);
    constexpr P maybeDigit=Optional<CAPACITY>(&digit);
    constexpr P aGroupB=Concatenation<CAPACITY>{&a,&maybeDigit,&groupB};
    constexpr P outer=Group<CAPACITY>(&aGroupB);
    constexpr P tree=Concatenation<CAPACITY>{&outer,&any,&notSpace};
    constexpr const P*patterns[]={&a,&any,&digit,&notSpace,&groupB,&maybeDigit,&aGroupB,&outer,&tree};
    void check(const P&pattern,const char*begin,const char*end){
        const Match<CAPACITY> m=pattern.match(begin,end);
        if((m.bytesConsumed==0)!=(m.groupsMatched==0)){std::abort();}
        if(m.groupsMatched>pattern.captures()){std::abort();}
        if(m.bytesConsumed>std::size_t(end-begin)){std::abort();}
        if(m.matched()&&m.groups[0]!=MatchGroup(0,m.bytesConsumed)){std::abort();}
        for(std::size_t i=1;i<m.groupsMatched;i++){
            if(m.groups[i].end>m.bytesConsumed){std::abort();}
        }
        if(pattern.match(begin,end)!=m){std::abort();}
    }
}
extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t*data,std::size_t size){
    const char*begin=reinterpret_cast<const char*>(data);
    for(const P*pattern:patterns){check(*pattern,begin,begin+size);}
    return 0;
}
