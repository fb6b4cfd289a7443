#ifndef INCLUDE_CODERUN_UTILS_H_
#define INCLUDE_CODERUN_UTILS_H_

#include <string>

#include "execution.h"

const char* StatusToDesc(Status);
const char* StatusToAbr(Status);

const char* LanguageName(Language);
// unknown names fall back to Python
Language GetLanguage(const std::string&);
const char* LanguageInterpreter(Language);
const char* LanguageEntryFile(Language);
const std::string& LanguageImage(Language);

// logging
const char* SourceKindName(SourceKind);

#endif  // INCLUDE_CODERUN_UTILS_H_
