#include <cqa/clang_parser_adapter.h>

#include <cqa/errors.h>

#include <clang-c/Index.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <tuple>
#include <type_traits>
#include <utility>

namespace cqa {
namespace {
using IndexHandle = std::unique_ptr<void, decltype(&clang_disposeIndex)>;
using TranslationUnitHandle =
    std::unique_ptr<std::remove_pointer_t<CXTranslationUnit>,
                    decltype(&clang_disposeTranslationUnit)>;

std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

std::pair<int, int> LineRange(CXCursor cursor) {
  const auto extent = clang_getCursorExtent(cursor);
  unsigned start_line = 0;
  unsigned end_line = 0;
  clang_getSpellingLocation(clang_getRangeStart(extent), nullptr, &start_line,
                            nullptr, nullptr);
  clang_getSpellingLocation(clang_getRangeEnd(extent), nullptr, &end_line,
                            nullptr, nullptr);
  return {static_cast<int>(start_line), static_cast<int>(end_line)};
}

bool IsFunctionKind(CXCursorKind kind) {
  return kind == CXCursor_FunctionDecl || kind == CXCursor_CXXMethod ||
         kind == CXCursor_Constructor || kind == CXCursor_Destructor ||
         kind == CXCursor_ConversionFunction ||
         kind == CXCursor_FunctionTemplate;
}

bool IsClassKind(CXCursorKind kind) {
  return kind == CXCursor_ClassDecl || kind == CXCursor_StructDecl ||
         kind == CXCursor_ClassTemplate || kind == CXCursor_UnionDecl;
}

bool IsDocumented(CXCursor cursor) {
  return !ToString(clang_Cursor_getRawCommentText(cursor)).empty();
}

std::string OwnerOf(CXCursor cursor) {
  const auto parent = clang_getCursorSemanticParent(cursor);
  if (clang_Cursor_isNull(parent) ||
      !IsClassKind(clang_getCursorKind(parent))) {
    return {};
  }
  return ToString(clang_getCursorSpelling(parent));
}

int CountParameters(CXCursor cursor) {
  int count = 0;
  clang_visitChildren(
      cursor,
      [](CXCursor child, CXCursor, CXClientData data) {
        if (clang_getCursorKind(child) == CXCursor_ParmDecl) {
          ++*static_cast<int *>(data);
        }
        return CXChildVisit_Continue;
      },
      &count);
  return count;
}

// Cyclomatic complexity approximated from the function's tokens: one path
// plus one per branch keyword or short-circuit operator.
int Complexity(CXTranslationUnit translation_unit, CXCursor cursor) {
  static const std::set<std::string> kBranchKeywords = {"if", "for", "while",
                                                        "case", "catch"};
  static const std::set<std::string> kBranchOperators = {"&&", "||", "?"};

  CXToken *tokens = nullptr;
  unsigned count = 0;
  clang_tokenize(translation_unit, clang_getCursorExtent(cursor), &tokens,
                 &count);
  int complexity = 1;
  for (unsigned index = 0; index < count; ++index) {
    const auto kind = clang_getTokenKind(tokens[index]);
    if (kind != CXToken_Keyword && kind != CXToken_Punctuation) {
      continue;
    }
    const auto spelling =
        ToString(clang_getTokenSpelling(translation_unit, tokens[index]));
    const auto &candidates =
        kind == CXToken_Keyword ? kBranchKeywords : kBranchOperators;
    if (candidates.count(spelling) > 0) {
      ++complexity;
    }
  }
  if (tokens != nullptr) {
    clang_disposeTokens(translation_unit, tokens, count);
  }
  return complexity;
}

class StructureCollector {
public:
  StructureCollector(CXTranslationUnit translation_unit, ParsedFile &parsed)
      : translation_unit_(translation_unit), parsed_(&parsed) {}

  void Collect() {
    VisitChildren(clang_getTranslationUnitCursor(translation_unit_));
  }

private:
  void VisitChildren(CXCursor cursor) {
    clang_visitChildren(
        cursor,
        [](CXCursor child, CXCursor, CXClientData data) {
          auto *collector = static_cast<StructureCollector *>(data);
          collector->Traverse(child);
          return CXChildVisit_Continue;
        },
        this);
  }

  void Traverse(CXCursor cursor) {
    if (!clang_Location_isFromMainFile(clang_getCursorLocation(cursor))) {
      return;
    }
    const auto kind = clang_getCursorKind(cursor);
    if (kind == CXCursor_InclusionDirective) {
      AddInclude(cursor);
      return;
    }
    if (IsFunctionKind(kind)) {
      if (clang_isCursorDefinition(cursor)) {
        AddFunction(cursor);
      }
      return;
    }
    if (IsClassKind(kind) && clang_isCursorDefinition(cursor)) {
      AddClass(cursor);
      VisitChildren(cursor);
      return;
    }
    if (kind == CXCursor_Namespace || kind == CXCursor_LinkageSpec) {
      VisitChildren(cursor);
    }
  }

  void AddInclude(CXCursor cursor) {
    IncludeInfo include;
    include.target = ToString(clang_getCursorSpelling(cursor));
    include.line = LineRange(cursor).first;
    parsed_->includes.push_back(std::move(include));
  }

  void AddFunction(CXCursor cursor) {
    FunctionInfo function;
    function.name = ToString(clang_getCursorSpelling(cursor));
    function.owner = OwnerOf(cursor);
    std::tie(function.line_start, function.line_end) = LineRange(cursor);
    function.parameter_count = CountParameters(cursor);
    function.complexity = Complexity(translation_unit_, cursor);
    function.documented = IsDocumented(cursor);
    parsed_->functions.push_back(std::move(function));
  }

  void AddClass(CXCursor cursor) {
    auto name = ToString(clang_getCursorSpelling(cursor));
    if (name.empty()) {
      return;
    }
    ClassInfo info;
    info.name = std::move(name);
    std::tie(info.line_start, info.line_end) = LineRange(cursor);
    info.documented = IsDocumented(cursor);
    parsed_->classes.push_back(std::move(info));
  }

  CXTranslationUnit translation_unit_;
  ParsedFile *parsed_;
};

std::string ReadContent(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream.is_open()) {
    throw ParsingError(path.string(), "cannot open file");
  }
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

int CountLines(const std::string &content) {
  if (content.empty()) {
    return 0;
  }
  auto lines =
      static_cast<int>(std::count(content.begin(), content.end(), '\n'));
  if (content.back() != '\n') {
    ++lines;
  }
  return lines;
}
} // namespace

ClangParserAdapter::ClangParserAdapter(std::vector<std::string> extra_arguments,
                                       std::shared_ptr<Logger> logger)
    : extra_arguments_(std::move(extra_arguments)),
      logger_(EnsureLogger(std::move(logger))) {}

std::vector<std::string> ClangParserAdapter::SupportedLanguages() const {
  return {"c", "cpp"};
}

std::vector<std::string>
ClangParserAdapter::ArgumentsFor(const std::filesystem::path &path) const {
  std::vector<std::string> args;
  // Headers are parsed as C++ so that classes declared in them are seen.
  if (path.extension() == ".c") {
    args = {"-x", "c", "-std=c11"};
  } else {
    args = {"-x", "c++", "-std=c++17"};
  }
  // Plain comments count as documentation, not only doxygen ones.
  args.push_back("-fparse-all-comments");
  args.insert(args.end(), extra_arguments_.begin(), extra_arguments_.end());
  return args;
}

ParsedFile ClangParserAdapter::Parse(const std::filesystem::path &path) {
  ParsedFile parsed;
  parsed.path = path.string();
  parsed.language = DetectLanguage(path);
  const auto supported = SupportedLanguages();
  if (std::find(supported.begin(), supported.end(), parsed.language) ==
      supported.end()) {
    throw ParsingError(parsed.path,
                       "unsupported language '" + parsed.language + "'");
  }

  parsed.content = ReadContent(path);
  parsed.size_bytes = parsed.content.size();
  parsed.line_count = CountLines(parsed.content);

  const auto args = ArgumentsFor(path);
  std::vector<const char *> arg_pointers;
  arg_pointers.reserve(args.size());
  for (const auto &arg : args) {
    arg_pointers.push_back(arg.c_str());
  }

  IndexHandle index(clang_createIndex(0, 0), &clang_disposeIndex);
  if (!index) {
    throw ParsingError(parsed.path, "failed to create clang index");
  }
  CXTranslationUnit raw_unit = nullptr;
  const auto error = clang_parseTranslationUnit2(
      index.get(), parsed.path.c_str(), arg_pointers.data(),
      static_cast<int>(arg_pointers.size()), nullptr, 0,
      CXTranslationUnit_DetailedPreprocessingRecord |
          CXTranslationUnit_KeepGoing,
      &raw_unit);
  if (error != CXError_Success || raw_unit == nullptr) {
    throw ParsingError(parsed.path, "libclang failed with code " +
                                        std::to_string(error));
  }
  TranslationUnitHandle translation_unit(raw_unit,
                                         &clang_disposeTranslationUnit);

  StructureCollector collector(translation_unit.get(), parsed);
  collector.Collect();

  logger_->Log(LogLevel::kDebug, "parser.parsed",
               {{"path", parsed.path},
                {"functions", std::to_string(parsed.functions.size())},
                {"classes", std::to_string(parsed.classes.size())},
                {"diagnostics", std::to_string(clang_getNumDiagnostics(
                                    translation_unit.get()))}});
  return parsed;
}

} // namespace cqa
