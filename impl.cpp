#include "nanoPattern.hpp"
#include "debug.hpp"
#include <cstdio>
namespace NanoPattern_detail{
    void print_byte(std::FILE*out,std::uint8_t c,bool inClass){
        if(c<0x20||c>=0x7f){std::fprintf(out,"\\x%02x",c);return;}
        switch(c){
        case '\\':std::fputc('\\',out);break;
        case ']':case '^':case '-':
            if(inClass){std::fputc('\\',out);}
            break;
        case '.':case '[':case '(':case ')':case '?':case '*':case '+':case '{':case '}':case '|':case '$':
            if(!inClass){std::fputc('\\',out);}
            break;
        default:break;
        }
        std::fputc(c,out);
    }
    void print_group(std::FILE*out,std::size_t idx,const MatchGroup&group,const char*input){
        std::fprintf(out,"%2zu [%zu,%zu) \"",idx,group.begin,group.end);
        for(std::size_t i=group.begin;i<group.end;i++){
            std::uint8_t c=std::uint8_t(input[i]);
            if(c<0x20||c>=0x7f){std::fprintf(out,"\\x%02x",c);}
            else if(c=='"'||c=='\\'){std::fputc('\\',out);std::fputc(c,out);}
            else{std::fputc(c,out);}
        }
        std::fputs("\"\n",out);
    }
}
