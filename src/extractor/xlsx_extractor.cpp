#include "xlsx_extractor.hpp"
#include "../cache/cache.hpp"
#include "../logger/Mylogger.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <pugixml.hpp>

namespace extractor
{
    namespace
    {
        const unsigned int PARSE_FLAGS = pugi::parse_default | pugi::parse_ws_pcdata_single;

        // Element names may carry a namespace prefix ("x:c"); compare the local part only.
        const char *localName(const char *name)
        {
            const char *colon = std::strchr(name, ':');
            return colon ? colon + 1 : name;
        }

        bool named(const pugi::xml_node &node, const char *name)
        {
            return node.type() == pugi::node_element && std::strcmp(localName(node.name()), name) == 0;
        }

        pugi::xml_node child(const pugi::xml_node &node, const char *name)
        {
            for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling())
            {
                if (named(c, name))
                    return c;
            }
            return pugi::xml_node();
        }

        pugi::xml_attribute attribute(const pugi::xml_node &node, const char *name)
        {
            for (pugi::xml_attribute a = node.first_attribute(); a; a = a.next_attribute())
            {
                if (std::strcmp(localName(a.name()), name) == 0)
                    return a;
            }
            return pugi::xml_attribute();
        }

        // Concatenated text of every <t> below node, skipping phonetic runs.
        std::string collectText(const pugi::xml_node &node)
        {
            std::string text;
            for (pugi::xml_node c = node.first_child(); c; c = c.next_sibling())
            {
                if (named(c, "t"))
                    text += c.text().get();
                else if (named(c, "r"))
                    text += collectText(c);
            }
            return text;
        }

        errors::Status loadPart(const ZipArchive &archive, const std::string &name, pugi::xml_document &doc)
        {
            std::string xml;
            auto status = archive.read(name, xml);
            if (status != errors::Status::Ok)
                return status == errors::Status::NotFound ? errors::Status::Corrupt : status;

            pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size(), PARSE_FLAGS, pugi::encoding_utf8);
            if (!result)
            {
                MyLogger::warning("Malformed XML in " + name + ": " + result.description());
                return errors::Status::Corrupt;
            }
            return errors::Status::Ok;
        }

        cells::CellValue parseNumber(const std::string &text)
        {
            bool integral = !text.empty() && text.find_first_of(".eE") == std::string::npos;
            if (integral)
            {
                errno = 0;
                char *end = nullptr;
                long long v = std::strtoll(text.c_str(), &end, 10);
                if (errno == 0 && end && *end == '\0')
                    return static_cast<std::int64_t>(v);
            }
            char *end = nullptr;
            double d = std::strtod(text.c_str(), &end);
            if (end && *end == '\0')
                return d;
            return text;
        }

        std::string resolveTarget(const std::string &target)
        {
            if (!target.empty() && target[0] == '/')
                return target.substr(1);
            return "xl/" + target;
        }

        struct SharedFormula
        {
            std::string text;
            std::string anchor;
        };

        errors::Status readSheet(const pugi::xml_document &doc, const std::vector<std::string> &sharedStrings,
                                 cells::WorksheetMap &sheet)
        {
            pugi::xml_node sheetData = child(child(doc, "worksheet"), "sheetData");
            std::map<std::string, SharedFormula> shared;

            for (pugi::xml_node row = sheetData.first_child(); row; row = row.next_sibling())
            {
                if (!named(row, "row"))
                    continue;
                long rowNumber = attribute(row, "r").as_int(0);
                long nextColumn = 1;

                for (pugi::xml_node c = row.first_child(); c; c = c.next_sibling())
                {
                    if (!named(c, "c"))
                        continue;

                    std::string address = attribute(c, "r").as_string();
                    std::string column;
                    long cellRow = 0;
                    if (address.empty() || !splitAddress(address, column, cellRow))
                    {
                        if (rowNumber <= 0)
                            return errors::Status::Corrupt;
                        address = columnName(nextColumn) + std::to_string(rowNumber);
                        cellRow = rowNumber;
                        column = columnName(nextColumn);
                    }
                    nextColumn = columnIndex(column) + 1;

                    cells::CellRecord record;

                    pugi::xml_node f = child(c, "f");
                    if (f)
                    {
                        std::string text = f.text().get();
                        std::string si = attribute(f, "si").as_string();
                        bool isShared = std::strcmp(attribute(f, "t").as_string(), "shared") == 0;
                        if (isShared && !text.empty())
                        {
                            shared[si] = SharedFormula{text, address};
                        }
                        else if (isShared && text.empty())
                        {
                            auto it = shared.find(si);
                            if (it != shared.end())
                            {
                                std::string anchorColumn;
                                long anchorRow = 0;
                                splitAddress(it->second.anchor, anchorColumn, anchorRow);
                                text = shiftFormula(it->second.text, cellRow - anchorRow,
                                                    columnIndex(column) - columnIndex(anchorColumn));
                            }
                        }
                        if (!text.empty())
                            record.formula = "=" + text;
                    }

                    std::string type = attribute(c, "t").as_string();
                    pugi::xml_node v = child(c, "v");
                    if (type == "inlineStr")
                    {
                        pugi::xml_node is = child(c, "is");
                        if (is)
                            record.value = collectText(is);
                    }
                    else if (v)
                    {
                        std::string text = v.text().get();
                        if (type == "s")
                        {
                            char *end = nullptr;
                            unsigned long index = std::strtoul(text.c_str(), &end, 10);
                            if (text.empty() || *end != '\0' || index >= sharedStrings.size())
                            {
                                MyLogger::warning("Shared string index out of range at " + address);
                                return errors::Status::Corrupt;
                            }
                            record.value = sharedStrings[index];
                        }
                        else if (type == "b")
                        {
                            record.value = (text == "1" || text == "true");
                        }
                        else if (type == "str" || type == "e" || type == "d")
                        {
                            record.value = text;
                        }
                        else if (!text.empty())
                        {
                            record.value = parseNumber(text);
                        }
                    }

                    if (!record.empty())
                        sheet[address] = record;
                }
            }
            return errors::Status::Ok;
        }
    }

    bool splitAddress(const std::string &address, std::string &column, long &row)
    {
        std::size_t i = 0;
        while (i < address.size() && std::isupper(static_cast<unsigned char>(address[i])))
            ++i;
        if (i == 0 || i > 3 || i == address.size())
            return false;
        for (std::size_t j = i; j < address.size(); ++j)
        {
            if (!std::isdigit(static_cast<unsigned char>(address[j])))
                return false;
        }
        column = address.substr(0, i);
        row = std::strtol(address.c_str() + i, nullptr, 10);
        return row > 0;
    }

    long columnIndex(const std::string &column)
    {
        long index = 0;
        for (char ch : column)
            index = index * 26 + (ch - 'A' + 1);
        return index;
    }

    std::string columnName(long index)
    {
        std::string name;
        while (index > 0)
        {
            long rem = (index - 1) % 26;
            name.insert(name.begin(), static_cast<char>('A' + rem));
            index = (index - 1) / 26;
        }
        return name;
    }

    std::string shiftFormula(const std::string &formula, long rowDelta, long colDelta)
    {
        std::string out;
        std::size_t i = 0;
        const std::size_t n = formula.size();

        auto isWordChar = [](char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '.';
        };

        while (i < n)
        {
            char ch = formula[i];

            // String literals and quoted sheet names are copied untouched.
            if (ch == '"' || ch == '\'')
            {
                std::size_t end = formula.find(ch, i + 1);
                while (end != std::string::npos && end + 1 < n && formula[end + 1] == ch)
                    end = formula.find(ch, end + 2);
                end = (end == std::string::npos) ? n : end + 1;
                out.append(formula, i, end - i);
                i = end;
                continue;
            }

            bool boundary = (i == 0) || !isWordChar(formula[i - 1]);
            if (boundary && (ch == '$' || std::isupper(static_cast<unsigned char>(ch))))
            {
                std::size_t j = i;
                bool colAbs = false, rowAbs = false;
                if (formula[j] == '$')
                {
                    colAbs = true;
                    ++j;
                }
                std::size_t colStart = j;
                while (j < n && std::isupper(static_cast<unsigned char>(formula[j])) && j - colStart < 3)
                    ++j;
                std::size_t colEnd = j;
                if (j < n && formula[j] == '$')
                {
                    rowAbs = true;
                    ++j;
                }
                std::size_t rowStart = j;
                while (j < n && std::isdigit(static_cast<unsigned char>(formula[j])))
                    ++j;

                bool isReference = colEnd > colStart && j > rowStart &&
                                   (j == n || (!isWordChar(formula[j]) && formula[j] != '('));
                if (isReference)
                {
                    long col = columnIndex(formula.substr(colStart, colEnd - colStart));
                    long row = std::strtol(formula.c_str() + rowStart, nullptr, 10);
                    if (!colAbs)
                        col += colDelta;
                    if (!rowAbs)
                        row += rowDelta;
                    if (col < 1 || row < 1)
                    {
                        out += "#REF!";
                    }
                    else
                    {
                        out += (colAbs ? "$" : "") + columnName(col) + (rowAbs ? "$" : "") + std::to_string(row);
                    }
                    i = j;
                    continue;
                }

                // Not a reference: copy the whole word so its tail is not mistaken for one.
                std::size_t end = i + 1;
                while (end < n && isWordChar(formula[end]))
                    ++end;
                out.append(formula, i, end - i);
                i = end;
                continue;
            }

            out += ch;
            ++i;
        }
        return out;
    }

    XlsxExtractor::XlsxExtractor(std::shared_ptr<cache::LocalMirror> mirror) : mirror_(std::move(mirror)) {}

    std::string XlsxExtractor::localPath(const std::string &path)
    {
        return mirror_ ? mirror_->ensureLocalCopy(path) : path;
    }

    errors::Status XlsxExtractor::readWorkbook(const ZipArchive &archive, cells::WorkbookSnapshot &snapshot)
    {
        pugi::xml_document workbook;
        auto status = loadPart(archive, "xl/workbook.xml", workbook);
        if (status != errors::Status::Ok)
            return status;

        pugi::xml_document rels;
        status = loadPart(archive, "xl/_rels/workbook.xml.rels", rels);
        if (status != errors::Status::Ok)
            return status;

        std::map<std::string, std::string> targets;
        for (pugi::xml_node r = child(rels, "Relationships").first_child(); r; r = r.next_sibling())
        {
            if (named(r, "Relationship"))
                targets[r.attribute("Id").as_string()] = r.attribute("Target").as_string();
        }

        std::vector<std::string> sharedStrings;
        if (archive.contains("xl/sharedStrings.xml"))
        {
            pugi::xml_document sst;
            status = loadPart(archive, "xl/sharedStrings.xml", sst);
            if (status != errors::Status::Ok)
                return status;
            for (pugi::xml_node si = child(sst, "sst").first_child(); si; si = si.next_sibling())
            {
                if (named(si, "si"))
                    sharedStrings.push_back(collectText(si));
            }
        }

        cells::WorkbookSnapshot result;
        pugi::xml_node sheets = child(child(workbook, "workbook"), "sheets");
        for (pugi::xml_node s = sheets.first_child(); s; s = s.next_sibling())
        {
            if (!named(s, "sheet"))
                continue;
            std::string name = s.attribute("name").as_string();
            auto target = targets.find(attribute(s, "id").as_string());
            if (target == targets.end())
            {
                MyLogger::warning("Worksheet without relationship: " + name);
                return errors::Status::Corrupt;
            }
            if (target->second.find("worksheets/") == std::string::npos)
                continue; // chart sheets carry no cells

            pugi::xml_document sheetDoc;
            status = loadPart(archive, resolveTarget(target->second), sheetDoc);
            if (status != errors::Status::Ok)
                return status;

            cells::WorksheetMap sheet;
            status = readSheet(sheetDoc, sharedStrings, sheet);
            if (status != errors::Status::Ok)
                return status;
            if (!sheet.empty())
                result[name] = std::move(sheet);
        }

        snapshot.swap(result);
        return errors::Status::Ok;
    }

    std::optional<std::string> XlsxExtractor::readLastAuthor(const ZipArchive &archive)
    {
        if (!archive.contains("docProps/core.xml"))
            return std::nullopt;
        pugi::xml_document core;
        if (loadPart(archive, "docProps/core.xml", core) != errors::Status::Ok)
            return std::nullopt;
        pugi::xml_node author = child(child(core, "coreProperties"), "lastModifiedBy");
        std::string text = author.text().get();
        if (text.empty())
            return std::nullopt;
        return text;
    }

    errors::Status XlsxExtractor::extract(const std::string &path, cells::WorkbookSnapshot &snapshot)
    {
        ZipArchive archive;
        auto status = archive.open(localPath(path));
        if (status != errors::Status::Ok)
        {
            MyLogger::warning(std::string("Cannot read workbook ") + path + ": " + errors::toString(status));
            return status;
        }
        status = readWorkbook(archive, snapshot);
        if (status != errors::Status::Ok)
            MyLogger::warning(std::string("Workbook is not a readable xlsx: ") + path);
        return status;
    }

    std::optional<std::string> XlsxExtractor::lastAuthor(const std::string &path)
    {
        ZipArchive archive;
        if (archive.open(localPath(path)) != errors::Status::Ok)
            return std::nullopt;
        return readLastAuthor(archive);
    }
} // namespace extractor
