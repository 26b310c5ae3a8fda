// Built-in leftover catalogs

#include "catalog.h"
#include <algorithm>
#include <set>
#include <stdexcept>

bool parse_language(const std::string& name, Language& out) {
    if (name == "en") {
        out = Language::EN;
    } else if (name == "pt-br" || name == "ptbr") {
        out = Language::PT_BR;
    } else if (name == "all") {
        out = Language::ALL;
    } else {
        return false;
    }
    return true;
}

std::string language_name(Language lang) {
    switch (lang) {
        case Language::EN: return "en";
        case Language::PT_BR: return "pt-br";
        case Language::ALL: return "all";
    }
    return "all";
}

const Catalog& Catalog::builtin() {
    static const Catalog catalog;
    return catalog;
}

Catalog::Catalog() {
    extension_groups_ = {
        {"critical_backup", "backup", {
            "bak", "backup", "old", "orig", "save", "copy", "tmp", "temp", "~",
            "asp", "aspx", "php", "jsp", "py"}},
        {"config_log", "log", {
            "txt", "log", "log1", "properties", "plist", "settings", "lock",
            "csv", "pid", "out", "err", "debug", "trace", "cache"}},
        {"backup_suffixes", "backup", {
            "bak", "bak1", "bak2", "backup", "old", "old1", "old2", "orig", "original",
            "save", "saved", "copy", "copy1", "copy2", "tmp", "temp", "new", "dist",
            "prev", "previous", "last", "~", ".~", "swp", "swo"}},
        {"archive", "archive", {
            "zip", "rar", "tar", "tar.gz", "tgz", "tbz2", "txz",
            "7z", "gz", "gzip", "bz2", "xz", "lzma", "z", "Z", "ace", "arj"}},
        {"database", "database", {
            "sql", "dump", "db", "sqlite", "sqlite3", "mdb", "accdb", "dbf",
            "sdf", "mdf", "ldf", "frm", "ibd", "opt", "par", "TRG", "TRN"}},
        {"config", "config", {
            "env", "config", "cfg", "conf", "ini", "yaml", "yml", "json", "xml",
            "properties", "plist", "toml"}},
        {"ide_leftover", "editor", {
            "swp", "swo", "swn", "tmp~", "tmp.swp", "tmp.save", "sml",
            "autosave", "kate-swp", "bak~", "backup~", ".tmp", ".temp"}},
        {"code_backup", "source", {
            "php.bak", "php.old", "php.save", "php.tmp", "php~", "php.orig",
            "jsp.bak", "jsp.old", "jsp.save", "jsp~", "jsp.orig",
            "asp.bak", "asp.old", "asp.save", "asp~", "asp.orig",
            "aspx.bak", "aspx.old", "aspx.save", "aspx~", "aspx.orig",
            "py.bak", "py.old", "py.save", "py~", "py.orig", "py.tmp",
            "rb.bak", "rb.old", "rb.save", "rb~", "rb.orig",
            "sh.bak", "sh.old", "sh.save", "sh~", "sh.orig",
            "js.bak", "js.old", "js.save", "js~", "js.orig",
            "css.bak", "css.old", "css.save", "css~", "css.orig",
            "html.bak", "html.old", "html.save", "html~", "html.orig"}},
        {"document", "document", {
            "pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx",
            "pdf.bak", "doc.bak", "docx.bak", "xls.bak", "xlsx.bak",
            "rtf", "odt", "ods", "odp", "txt.bak", "csv.bak"}},
        {"security", "credential", {
            "key", "pem", "crt", "cert", "p12", "pfx", "jks", "keystore", "csr",
            "htpasswd", "passwd", "shadow", "pwd", "secret", "credentials",
            "token", "auth", "oauth", "session", "cookie", "api_key",
            "private", "public", "rsa", "dsa", "ssh", "gpg", "pgp"}},
        {"build_config", "build", {
            "env.local", "env.dev", "env.prod", "env.test", "env.staging", "env.backup",
            "lock.json", "yarn.lock", "package-lock.json", "composer.lock", "Pipfile.lock",
            "requirements.txt.bak", "pom.xml.bak", "build.gradle.bak", "Makefile.bak"}},
        {"extras", "generic", {
            "wml", "bkl", "wmls", "udl", "bat", "dll", "reg", "cmd", "vbs",
            "hta", "wsf", "cpl", "msc", "lnk", "url", "inf", "ins", "isp",
            "ash", "ashx", "cs", "publishproj", "cvs"}},
    };

    critical_files_ = {
        {"certificate.pfx", "credential"}, {"private.key", "credential"},
        {"ca_bundle.crt", "credential"},
        {".env", "credential"}, {".environment", "credential"},
        {".envrc", "credential"}, {".envs", "credential"},
        {"accesstoken", "credential"}, {"accesstokens.json", "credential"},
        {".htaccess", "config"}, {"web.config", "config"}, {"web.debug.config", "config"},
    };

    specific_files_ = {
        {"webserver-plugin.xml", "config"}, {"webserver.ini", "config"},
        {"swagger-ui", "generic"}, {"redoc", "generic"},
        {".dockerignore", "build"}, {".npmrc", "credential"},
        {"env-config.js", "config"}, {"env.js", "config"}, {"environment.js", "config"},
        {"environment.json", "config"}, {"environment.ts", "config"},
        {".DS_Store", "editor"}, {".well-known", "generic"},
        {"robots.txt", "generic"}, {"sitemap.xml", "generic"},
        {"log_all", "log"}, {"error_log", "log"}, {"access_log", "log"},
        {"log.mdb", "database"}, {"latest-logs.zip", "archive"},
    };

    vcs_files_ = {
        {".git/config", "vcs"}, {".svn/entries", "vcs"}, {".git", "vcs"},
        {".gitignore", "vcs"}, {".gitattributes", "vcs"}, {".gitmodules", "vcs"},
        {".hgignore", "vcs"}, {".hgsub", "vcs"}, {".hgsubstate", "vcs"},
    };

    word_groups_ = {
        {"level_core", WordLang::NEUTRAL, {
            "backup", "old", "temp", "test", "dev",
            "staging", "archive", "copy", "original", "previous"}},
        {"files", WordLang::NEUTRAL, {
            "README", "assets", "composer", "content", "contents", "debug", "logging",
            "package", "readme", "service", "service1", "swagger", "test", "trace", "ws",
            "settings", "index", "front", "update", "modelo", "modelos", "localhost"}},
        {"backup_directory", WordLang::NEUTRAL, {
            "anterior", "antigo", "archive", "archived", "archives", "atual", "back",
            "backup", "bkp", "copy", "copia", "current", "deletar", "delete", "dev",
            "devel", "development", "draft", "guardar", "historical", "history", "hml",
            "homolog", "homologacao", "homologation", "latest", "lixo", "log", "logs",
            "new", "novo", "old", "old_version", "orig", "original", "prd", "prod",
            "producao", "production", "rascunho", "release", "reserva", "salvo", "save",
            "saved", "security", "seguranca", "stable", "staging", "temp", "temporario",
            "temporary", "tmp", "trash", "version", "versao"}},
        {"web", WordLang::EN, {
            "backend", "conteudo", "deploy", "frontend", "hosting", "hospedagem",
            "htdocs", "html", "httpdocs", "inetpub", "page", "pagina", "portal",
            "public", "public_html", "publication", "publicacao", "site", "sistema",
            "static", "system", "web", "webpage", "webroot", "website", "www", "www-data",
            "arq", "arquivo", "arquivos", "webserver", "webservice", "wordpress",
            "wp_engine", "wp_content", "wp_includes", "wp", "wp_backup"}},
        {"vcs", WordLang::EN, {
            ".git", ".svn", "bk", "cvs", "git", "hg", "svn"}},
        {"date_version", WordLang::EN, {
            "1", "2", "1.0", "2.0", "200", "2001", "2006", "2007", "2008", "2009",
            "2013", "2014", "2019", "2020", "2021", "2022", "2023", "2024", "2025", "2026",
            "abr", "abril", "ago", "agosto", "apr", "april", "aug", "august",
            "dec", "december", "dez", "dezembro", "feb", "february", "fev", "fevereiro",
            "jan", "janeiro", "jul", "july", "jun", "junho", "june", "mai", "maio",
            "mar", "march", "marco", "may", "nov", "november", "novembro",
            "oct", "october", "out", "outubro", "sep", "september", "set", "setembro",
            "v1", "v2", "v3"}},
        {"en_common", WordLang::EN, {
            "access", "account", "accounting", "action", "actions", "activity", "activities",
            "admin", "administrative", "app", "application", "approved", "attachment",
            "authentication", "balance", "billing", "board", "bookkeeping", "box", "branch",
            "budget", "candidate", "certificate", "client", "compliance", "company",
            "configuration", "conf", "config", "contract", "corporate", "credit", "data",
            "database", "db", "debit", "default", "department", "developer", "digitize",
            "dist", "documentation", "download", "dump", "election", "electoral", "email",
            "emergency", "encryption", "entity", "expense", "export", "financial", "fiscal",
            "firewall", "flow", "form", "foundation", "government", "group", "guide",
            "guidelines", "guides", "help", "hidden", "hiring", "id", "important", "import",
            "income", "information", "input", "install", "institutional", "internal",
            "inventory", "intranet", "loss", "mail", "maintenance", "management", "manual",
            "manuals", "memo", "message", "ministry", "model", "network", "nfe", "nfse",
            "norm", "normative", "norms", "note", "notice", "organization", "ordinance",
            "output", "password", "payable", "payment", "pending", "planning", "policy",
            "prefecture", "private", "printing", "printer", "process", "product", "program",
            "programs", "project", "proposal", "proposals", "protocol", "proxy", "purchase",
            "queue", "receivable", "record", "recovery", "register", "registration",
            "regulated", "regulation", "regulatory", "report", "reports", "research",
            "resolution", "restricted", "result", "reviewed", "sale", "sales", "scanner",
            "secret", "secretary", "sent", "server", "service", "settings", "setup",
            "society", "statement", "strategy", "strategic", "supplier", "support", "tax",
            "test", "token", "transaction", "unit", "upload", "uploads", "user", "vpn", "wap"}},
        {"ptbr_common", WordLang::PT_BR, {
            "acesso", "ajuda", "api", "aplicacao", "aplicativo", "aprovado", "configuracao",
            "dados", "desenvolvedor", "documentacao", "emergencia", "importante",
            "informacao", "interno", "manutencao", "pendente", "privado", "projeto",
            "recuperacao", "restrito", "revisado", "secreto", "segredo", "senha",
            "servico", "servidor", "suporte", "teste", "usuario", "webservice", "webservices"}},
        {"ptbr_business", WordLang::PT_BR, {
            "admin", "administrativo", "balanco", "boleto", "cadastro", "carteira",
            "cliente", "cobranca", "comercial", "compra", "contabil", "contabilidade",
            "credito", "debito", "despesa", "diretoria", "estoque", "extrato", "fatura",
            "financeiro", "fiscal", "fluxo", "formulario", "fornecedor", "gerencia",
            "investimento", "lucro", "nfe", "nfse", "orcamento", "orcamentos", "pagar",
            "pagamento", "pesquisa", "prejuizo", "produto", "receber", "receita", "registro",
            "verificar", "relatorio", "relatorios", "resultado", "transacao", "venda", "vendas",
            "valor", "valores", "campanha", "campanhas", "cartao", "cartoes", "comissao",
            "comissoes", "corretora", "corretoras", "cotacao", "cotacoes", "financiamento",
            "consorcio", "imobiliario", "imoveis", "imovel", "investidor", "investidores",
            "leilao", "leiloes", "lote", "lotes", "patrimonio", "prospeccao", "prospeccoes",
            "seguros", "seguro", "taxa", "taxas", "prolabore", "tributo", "tributos",
            "tributacao", "tributacoes", "tributario", "tributarios", "vencimento",
            "vencimentos", "vendedor", "vendedores", "vitrine", "vitrines"}},
        {"ptbr_corporate", WordLang::PT_BR, {
            "acao", "acoes", "associacao", "atividade", "atividades", "auditoria",
            "candidato", "cnpj", "comite", "compliance", "concurso", "conselho", "conta",
            "contratacao", "contrato", "contratos", "corporativo", "cpf", "departamento",
            "diretrizes", "edital", "eleicao", "eleitoral", "empresa", "entidade", "estrategia",
            "estrategico", "filial", "fundacao", "gestao", "governo", "grupo", "guia",
            "guias", "imposto", "institucional", "inscricao", "licitacao", "manual",
            "manuals", "memorando", "ministerio", "norma", "normas", "normativo", "nota",
            "organizacao", "planejamento", "politica", "portaria", "prefeitura", "processo",
            "programa", "programas", "proposta", "propostas", "protocolo", "regulamento",
            "regulamentacao", "resolucao", "rg", "sede", "secretaria", "sociedade", "unidade"}},
        {"ptbr_technical", WordLang::PT_BR, {
            "anexo", "autenticacao", "caixa", "certificado", "correio", "criptografia",
            "digitalizar", "download", "email", "entrada", "enviado", "extranet", "fila",
            "firewall", "impressao", "impressora", "intranet", "mensagem", "proxy", "rede",
            "saida", "scanner", "token", "upload", "uploads", "vpn", "variaveis", "variavel"}},
        {"database_config", WordLang::NEUTRAL, {
            "conf", "config", "data", "database", "db", "dist", "dump", "exportacao",
            "hidden", "importacao", "install", "internal", "padrao", "private",
            "settings", "setup", "modelos", "modelo", "sql", "structure", "tmp", "temp"}},
    };
}

const Catalog::Group& Catalog::group(const std::string& name) const {
    for (const auto& g : extension_groups_) {
        if (g.name == name) return g;
    }
    throw std::out_of_range("unknown extension group: " + name);
}

const Catalog::WordGroup& Catalog::word_group(const std::string& name) const {
    for (const auto& g : word_groups_) {
        if (g.name == name) return g;
    }
    throw std::out_of_range("unknown word group: " + name);
}

bool Catalog::word_allowed(const std::string& word, Language lang) const {
    if (lang == Language::ALL) return true;
    for (const auto& g : word_groups_) {
        bool lang_ok = g.lang == WordLang::NEUTRAL ||
                       (g.lang == WordLang::EN && lang == Language::EN) ||
                       (g.lang == WordLang::PT_BR && lang == Language::PT_BR);
        if (!lang_ok) continue;
        if (std::find(g.values.begin(), g.values.end(), word) != g.values.end()) return true;
    }
    return false;
}

LevelSelection Catalog::for_level(int level, Language lang) const {
    LevelSelection sel;
    level = std::max(0, std::min(level, kMaxLevel));

    std::set<std::string> seen_ext;
    auto add_ext = [&](const std::string& name, size_t limit) {
        const Group& g = group(name);
        size_t n = std::min(limit, g.values.size());
        for (size_t i = 0; i < n; i++) {
            if (seen_ext.insert(g.values[i]).second) {
                sel.extensions.push_back({g.values[i], g.category});
            }
        }
    };

    std::set<std::string> seen_files;
    auto add_files = [&](const std::vector<CatalogEntry>& files, size_t limit) {
        size_t n = std::min(limit, files.size());
        for (size_t i = 0; i < n; i++) {
            if (seen_files.insert(files[i].value).second) sel.files.push_back(files[i]);
        }
    };

    std::set<std::string> seen_words;
    auto add_words = [&](const std::string& name, size_t limit) {
        const WordGroup& g = word_group(name);
        size_t n = std::min(limit, g.values.size());
        for (size_t i = 0; i < n; i++) {
            const std::string& w = g.values[i];
            if (!word_allowed(w, lang)) continue;
            if (seen_words.insert(w).second) sel.words.push_back(w);
        }
    };

    const size_t all = static_cast<size_t>(-1);

    // Each level appends to the one below, so selections nest.
    add_files(critical_files_, all);

    if (level >= 1) {
        add_ext("critical_backup", all);
        add_words("level_core", 5);
    }
    if (level >= 2) {
        add_ext("config_log", all);
        add_ext("security", 20);
        add_ext("database", 10);
        add_ext("config", 15);
        add_ext("code_backup", 20);
        add_files(specific_files_, 30);
        add_words("level_core", all);
    }
    if (level >= 3) {
        for (const auto& g : extension_groups_) {
            if (g.name != "extras") add_ext(g.name, all);
        }
        add_files(vcs_files_, all);
        add_words("files", all);
        add_words("backup_directory", 40);
        add_words("web", all);
        add_words("en_common", 40);
        add_words("ptbr_common", 30);
        add_words("vcs", all);
        add_words("date_version", 20);
    }
    if (level >= 4) {
        add_ext("extras", all);
        for (const auto& g : word_groups_) add_words(g.name, all);
    }
    return sel;
}

std::string Catalog::category_of(const std::string& extension) const {
    for (const auto& g : extension_groups_) {
        if (std::find(g.values.begin(), g.values.end(), extension) != g.values.end()) {
            return g.category;
        }
    }
    return "generic";
}

std::vector<std::string> Catalog::domain_suffixes() const {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const char* name : {"archive", "backup_suffixes", "database"}) {
        for (const auto& v : group(name).values) {
            if (out.size() >= 50) return out;
            if (seen.insert(v).second) out.push_back(v);
        }
    }
    return out;
}

bool Catalog::is_critical_file(const std::string& name) const {
    for (const auto& f : critical_files_) {
        if (f.value == name) return true;
    }
    return false;
}
