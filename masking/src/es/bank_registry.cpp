// Concord
//
// Copyright (c) 2026 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#include "masking/es/bank_registry.hpp"

#include <iterator>

#include "Logger.hpp"
#include "masking/random.hpp"

namespace masking::es {

namespace {

// Source: https://www.iban.es/codigos-de-entidades-bancarias.html
// clang-format off
const std::map<std::string, BankEntry>& bankTable() {
  static const std::map<std::string, BankEntry> table = {
    {"0003", {"0003", "BANCO-DEPOSITOS", "BDEPESM1XXX"}},
    {"0011", {"0011", "ALLFUNDS-BANK", "ALLFESMMXXX"}},
    {"0019", {"0019", "DEUTSCHE-BANK", "DEUTESBBXXX"}},
    {"0031", {"0031", "BANCO-ETCHEVARRIA", "ETCHES2GXXX"}},
    {"0036", {"0036", "SANTANDER-IVESTMENT", "SABNESMMXXX"}},
    {"0038", {"0038", "SANTANDER-BANCO-EMISIONES", "BSCHESMMXXX"}},
    {"0046", {"0046", "BANCO-GALLEGO", "GALEES2GXXX"}},
    {"0049", {"0049", "BANCO-SANTANDER", "BSCHESMMXXX"}},
    {"0057", {"0057", "BANCO-DEPOSITARIO-BBVA", "BVADESMMXXX"}},
    {"0058", {"0058", "BNP-PARIBAS", "BNPAESMMXXX"}},
    {"0059", {"0059", "BANCO-MADRID", "MADRESMMXXX"}},
    {"0061", {"0061", "BANCA-MARCH", "BMARES2MXXX"}},
    {"0065", {"0065", "BLARCLAYS-BANK", "BARCESMMXXX"}},
    {"0073", {"0073", "OPEN-BANK", "OPENESMMXXX"}},
    {"0075", {"0075", "BANCO-POPULAR", "POPUESMMXXX"}},
    {"0078", {"0078", "BANCO-PUEYO", "BAPUES22XXX"}},
    {"0081", {"0081", "BANCO-SABADELL", "BSABESBBXXX"}},
    {"0083", {"0083", "RENTA4", "RENBESMMXXX"}},
    {"0094", {"0094", "RBC-INVESTOR", "BVALESMMXXX"}},
    {"0108", {"0108", "SOCIETE-GENERALE", "SOGEESMMXXX"}},
    {"0113", {"0113", "BANCO-INDUSTRIAL-BILBAO", "INBBESM1XXX"}},
    {"0115", {"0115", "BANCO-CASTILLA-LAMANCHA", "CECAESMM115"}},
    {"0121", {"0121", "BANCO-OCCIDENTAL", "OCBAESM1XXX"}},
    {"0122", {"0122", "CITIBANK", "CITIES2XXXX"}},
    {"0125", {"0125", "BANCOFAR", "BAOFESM1XXX"}},
    {"0128", {"0128", "BANKINTER", "BKBKESMMXXX"}},
    {"0130", {"0130", "BANCO-CAIXA-GRAL", "CGDIESMMXXX"}},
    {"0131", {"0131", "BANCO-ESPIRITO-SANTO", "BESMESMMXXX"}},
    {"0132", {"0132", "BANCO-PROMOCION-NEGOCIOS", "PRNEESM1XXX"}},
    {"0133", {"0133", "NUEVO-MICROBANK", "MIKBESB1XXX"}},
    {"0136", {"0136", "ARESBANK", "AREBESMMXXX"}},
    {"0138", {"0138", "BANKOA", "BKOAES22XXX"}},
    {"0144", {"0144", "BNP-PARIBAS-SECURITES", "PARBESMXXXX"}},
    {"0149", {"0149", "BNP-SUCURSLA-ESPANA", "BNPAESMSXXX"}},
    {"0151", {"0151", "JPMORGAN", "CHASESM3XXX"}},
    {"0152", {"0152", "BARCLAYS-BANK", "BPLCESMMXXX"}},
    {"0154", {"0154", "CREDIT-AGRICOLE-INVETBANK", "BSUIESMMXXX"}},
    {"0155", {"0155", "BANCO-DO-BRASIL", "BRASESMMXXX"}},
    {"0156", {"0156", "ROYAL-BANK-SCOTLAND", "ABNAESMMXXX"}},
    {"0159", {"0159", "COMMERZBANK", "COBAESMXXXX"}},
    {"0160", {"0160", "BANK-OF-TOKYO", "BOTKESMXXXX"}},
    {"0161", {"0161", "DEUTSCHE-BANK-AMERICAS", "BKTRESM1XXX"}},
    {"0162", {"0162", "HSBC-BANK", "MIDLESMMXXX"}},
    {"0167", {"0167", "BNP-PARIBAS-FORTIS", "GEBAESMMXXX"}},
    {"0168", {"0168", "ING-BELGIUM", "BBRUESMXXXX"}},
    {"0169", {"0169", "BANCO-NACION-ARGENTINA", "NACNESMMXXX"}},
    {"0182", {"0182", "BBVA", "BBVAESMMXXX"}},
    {"0184", {"0184", "BANCO-EUROPEO-FINANZAS", "BEDFESM1XXX"}},
    {"0186", {"0186", "BANDO-MEDIOLANUM", "BFIVESBBXXX"}},
    {"0188", {"0188", "BANCO-ALCALA", "ALCLESMMXXX"}},
    {"0190", {"0190", "BANCO-BPI", "BBPIESMMXXX"}},
    {"0196", {"0196", "PORTIGON-AG", "WELAESMMXXX"}},
    {"0198", {"0198", "BANCO-COOPERATIVO-ESPANOL", "BCOEESMMXXX"}},
    {"0200", {"0200", "PRIVAT-BANK-DEGROOF", "PRVBESB1XXX"}},
    {"0211", {"0211", "EBN-BANCO-NEGOCIOS", "PROAESMMXXX"}},
    {"0216", {"0216", "TARGOBANK", "POHIESMMXXX"}},
    {"0218", {"0218", "FCE-BANK-PLC", "FCEFESM1XXX"}},
    {"0219", {"0219", "BANQUE-MAROCAINE-COMMERCE", "BMCEESMMXXX"}},
    {"0220", {"0220", "BANCO-FINANTIA-CAPITAL", "FIOFESM1XXX"}},
    {"0223", {"0223", "GENERAL-ELECTRIC-BANK", "GEECESB1XXX"}},
    {"0224", {"0224", "SANTANDER-CONSUMER", "SCFBESMMXXX"}},
    {"0225", {"0225", "BANCO-CETELEM", "FIEIESM1XXX"}},
    {"0226", {"0226", "UBS-BANK", "UBSWESMMXXX"}},
    {"0227", {"0227", "UNOE-BANK", "UNOEESM1XXX"}},
    {"0229", {"0229", "BANCO-POPULAR-ESA", "POPLESMMXXX"}},
    {"0231", {"0231", "DEXIA-SABADELL", "DSBLESMMXXX"}},
    {"0232", {"0232", "BANCO-INVERSIS", "INVLESMMXXX"}},
    {"0233", {"0233", "POPULAR-BANCA-PRIVADA", "POPIESMMXXX"}},
    {"0234", {"0234", "BANCO-CAMINOS", "CCOCESMMXXX"}},
    {"0235", {"0235", "BANCO-PICHINCHA", "PIESESM1XXX"}},
    {"0236", {"0236", "SABADELL-SOLBANK", "LOYIESMMXXX"}},
    {"0237", {"0237", "CAJASUR-BANCO", "CSURES2CXXX"}},
    {"0238", {"0238", "BANCO-PASTOR", "POPUESMMXXX"}},
    {"0239", {"0239", "EVO-BANK", "EVOBESMMXXX"}},
    {"0444", {"0444", "SISTEMA-4B", ""}},
    {"0487", {"0487", "BANCO-MARE-NOSTRUM", "GBMNESMMXXX"}},
    {"0488", {"0488", "BANCO-FINANCIERO", "BFASESMMXXX"}},
    {"1000", {"1000", "ICO", "ICROESMMXXX"}},
    {"1451", {"1451", "CAISSE-REGIONALE-SUDMEDITERRANEE", "CRCGESB1XXX"}},
    {"1457", {"1457", "DELAGE-LANDEN-INTB", "LLISESM1XXX"}},
    {"1459", {"1459", "COPERATIVE-RAIFFEISEN", "PRABESMMXXX"}},
    {"1460", {"1460", "CREDIT-SUISSE-AG", "CRESESMMXXX"}},
    {"1463", {"1463", "BANQUE-PSA-FINANCE", "PSABESM1XXX"}},
    {"1465", {"1465", "ING-DIRECT", "INGDESMMXXX"}},
    {"1467", {"1467", "HYPOTHEKENBANK-FRNAKFURT", "EHYPESMXXXX"}},
    {"1470", {"1470", "BANCO-PORTUGUES-INVESTIMENTO", "BPIPESM1XXX"}},
    {"1472", {"1472", "CREDIT-AGRICOLE-FACTORING", "UCSSESM1XXX"}},
    {"1473", {"1473", "BANQUE-PREIVEE EDMOND", "PRIBESMXXXX"}},
    {"1474", {"1474", "CITIBANK-INTERNACIONAL", "CITIESMXXXX"}},
    {"1475", {"1475", "CORTAL-CONSORS", "CCSEESM1XXX"}},
    {"1479", {"1479", "NATIXIS", "NATXESMMXXX"}},
    {"1480", {"1480", "VOLKSWAGEN-BANK", "VOWAES21XXX"}},
    {"1481", {"1481", "BANCO-MAIS", "ESMMES64XXX"}},
    {"1482", {"1482", "JOHN-DEERE-BANK", "CHASESM3XXX"}},
    {"1485", {"1485", "BANK-OF-AMERICA", "BOFAES2XXXX"}},
    {"1487", {"1487", "TOYOTA-KREDITBANK", "TKGTFR21XXX"}},
    {"1488", {"1488", "PICTET-CIE", "PICTESMMXXX"}},
    {"1490", {"1490", "SELF-TRADE-BANK", "SELFESMMXXX"}},
    {"1491", {"1491", "TRIODOS-BANK", "TRIOESMMXXX"}},
    {"1492", {"1492", "BNP-PARIBAS-LEASE", "ESSIESMMXXX"}},
    {"1493", {"1493", "CAIXA-BANCO-INVESTIMENTO", "CXBIPTPLXXX"}},
    {"1494", {"1494", "INTESA-SANPAOLO", "BCITESMMXXX"}},
    {"1496", {"1496", "GENEFIM", "GENFFRP1XXX"}},
    {"1499", {"1499", "CLAAS-FINANCIAL", "CLAAFRP1XXX"}},
    {"1500", {"1500", "NATIXIS-LEASE", "NALEFRP1XXX"}},
    {"1501", {"1501", "DEUTSCHE-PFANDBRIEFBANK", "DPBBESM1XXX"}},
    {"1502", {"1502", "IKB-DEUTSCHE-INDUSTRIEBANK", "IKBDESM1XXX"}},
    {"1504", {"1504", "HONDA-BANK", "HONDDEF1XXX"}},
    {"1505", {"1505", "EUROPE-ARAB-BANK", "ARABESMMXXX"}},
    {"1508", {"1508", "RCI-BANQUE", "RCIDDE31XXX"}},
    {"1509", {"1509", "BANCO-PRIMUS", "PRUUPTP1XXX"}},
    {"1510", {"1510", "SAXO-BANK", "SAXODKKKXXX"}},
    {"1513", {"1513", "CAIXA-GERAL-DEPOSITOS", "CGDIES21XXX"}},
    {"1522", {"1522", "EFG-BANK", "EFGBESMMXXX"}},
    {"1523", {"1523", "MERCEDES-BENZ-BANK", "DEUTESBBXXX"}},
    {"1524", {"1524", "UBI-BANCA", "UBIBESMMXXX"}},
    {"1525", {"1525", "BANQUE-CHAABI-MAROC", "BCDMESMMXXX"}},
    {"1528", {"1528", "JCB-FINANCE", "ES1528"}},
    {"1530", {"1530", "SOFINLOC", "FIOFESM1XXX"}},
    {"1531", {"1531", "CREDIT-SUISSE", "CSROESM1XXX"}},
    {"1532", {"1532", "BNP-PARIBAS-FACTOR", "BNPAESMSXXX"}},
    {"1535", {"1535", "AKF-BANK", "AKFBDE33XXX"}},
    {"1536", {"1536", "OREY-FINANCIAL", "OVSCPTP1XXX"}},
    {"1538", {"1538", "INDUSTRIAL-COMMERCIAL-CHINA", "ICBKESMMXXX"}},
    {"1544", {"1544", "ANDBANK", "BACAESMMXXX"}},
    {"1545", {"1545", "CREDIT-ACRICOLE-LUXEMBURGO", "AGRIESMMXXX"}},
    {"1546", {"1546", "CNH-CAPITAL", "CNCUFRP1XXX"}},
    {"1549", {"1549", "MAINFIRST", "MAIFDFFXXX"}},
    {"2000", {"2000", "CECABANK", "CECAESMMXXX"}},
    {"2013", {"2013", "CATALUNYA-BANK", "CESCESBBXXX"}},
    {"2038", {"2038", "BANKIA", "CAHMESMMXXX"}},
    {"2045", {"2045", "CAIXA-DESTALVIS-ONTINENT", "CECAESMM045"}},
    {"2048", {"2048", "LEBERBANK", "CECAESMM048"}},
    {"2056", {"2056", "CAIXA-DESTALVIS-POLLENSA", "CECAESMM056"}},
    {"2080", {"2080", "NGC-BANCO", "CAGLESMMVIG"}},
    {"2085", {"2085", "IBERCAJA-BANCO", "CAZRES2ZXXX"}},
    {"2086", {"2086", "BANCO-GRUPO-CAJATRES", "CECAESMM086"}},
    {"2095", {"2095", "KUTXABANK", "BASKES2BXXX"}},
    {"2096", {"2096", "CAJA-ESPANA-NVERSIONES", "CSPAES2LXXX"}},
    {"2100", {"2100", "CAIXABANK", "CAIXESBBXXX"}},
    {"2103", {"2103", "UNICAJA-BANCO", "UCJAES2MXXX"}},
    {"2104", {"2104", "CAJA-SALAMANCA-SORIA", "CSSOES2SXXX"}},
    {"2105", {"2105", "BANCO-CASTILLA-MANCHA", "CECAESMM105"}},
    {"2108", {"2108", "BANCO-CAJAESPANA-SALAMANCASORIA", "CSPAES2L108"}},
    {"2401", {"2401", "CAJA-PENSIONES-BARCELONA", "CAIXESBBXXX"}},
    {"2414", {"2414", "CAJA-ASTURIAS", "CECAESMMO48"}},
    {"2415", {"2415", "CAJA-EXTREMADURA", "CECAESMM099"}},
    {"2416", {"2416", "CAJA-CANTABRIA", "CECAESMM066"}},
    {"2420", {"2420", "IBERCAJA", "CAZRES2ZXXX"}},
    {"2421", {"2421", "CAJA-GRANADA", "CECAESMM031"}},
    {"2422", {"2422", "CAJA-MURCIA", "CECAESMM043"}},
    {"2424", {"2424", "CAJA-BALEARES", "CECAESMM051"}},
    {"2426", {"2426", "CAJA-RONDA", "UCJAES2MXXX"}},
    {"2427", {"2427", "CAJA-INMACULADA", "CECAESMM427"}},
    {"2428", {"2428", "CAJA-CIRCULO-BUROS", "CECAESMM428"}},
    {"2429", {"2429", "CAJA-BADAJOZ", "CECAESMM429"}},
    {"2430", {"2430", "BILBAO-BIZKAIA-KUTXA", "BASKES2BXXX"}},
    {"2431", {"2431", "CAJA-GUIPUZOCA", "CGGKES22XXX"}},
    {"2432", {"2432", "CAJA-VITORIA-ALAVA", "CECAESMM097"}},
    {"2433", {"2433", "CECA", "CECAESMMXXX"}},
    {"3001", {"3001", "CAJA-RURAL-ALMENDRALEJO", "BCOEESMM001"}},
    {"3005", {"3005", "CAJA-RURAL-CENTRAL", "BCOEESMM005"}},
    {"3007", {"3007", "CAJA-RURAL-GIJON", "BCOEESMM007"}},
    {"3008", {"3008", "CAJA-RURAL-NAVARRA", "BCOEESMM008"}},
    {"3009", {"3009", "CAJA-RURAL-EXTREMADURA", "BCOEESMM009"}},
    {"3016", {"3016", "CAJA-RURAL-SALAMANCA", "BCOEESMM016"}},
    {"3017", {"3017", "CAJA-RURAL-SORIA", "BCOEESMM017"}},
    {"3018", {"3018", "CAJA-RURAL-SANAGUSTIN", "BCOEESMM018"}},
    {"3020", {"3020", "CAJA-RURAL-UTRERA", "BCOEESMM020"}},
    {"3023", {"3023", "CAJA-RURAL-GRANADA", "BCOEESMM023"}},
    {"3025", {"3025", "CAIXA-CREDIT-ENGINYERS", "CDENESBBXXX"}},
    {"3029", {"3029", "CAJA-CREDITO-PETREL", "BCOEESMM029"}},
    {"3035", {"3035", "CAJA-LABORAL-POPULAR", "CLPEES2MXXX"}},
    {"3045", {"3045", "CAIXA-RURAL-ALTEA", "BCOEESMM045"}},
    {"3058", {"3058", "CAJAS-RURALES-UNIDAS CAJAMAR", "CCRIES2AXXX"}},
    {"3059", {"3059", "CAJA-RURAL-ASTURIAS", "BCOEESMM059"}},
    {"3060", {"3060", "CAJA-RURAL-FUENTESEGOVIA", "BCOEESMM060"}},
    {"3063", {"3063", "CAJA-RURAL-CORDOBA", "BCOEESMM063"}},
    {"3067", {"3067", "CAJA-RURAL-JAEN", "BCOEESMM067"}},
    {"3070", {"3070", "CAIXA-RURAL-GALEGA", "BCOEESMM070"}},
    {"3076", {"3076", "CAJA-RURAL-CAJASIETE", "BCOEESMM076"}},
    {"3080", {"3080", "CAJA-RURAL-TERUEL", "BCOEESMM080"}},
    {"3081", {"3081", "CAJA-RURAL-CASTILLALAMANCHA", "BCOEESMM081"}},
    {"3085", {"3085", "CAJA-RURAL-ZAMORA", "BCOEESMM085"}},
    {"3089", {"3089", "CAJA-RURAL-BAENA", "BCOEESMM089"}},
    {"3095", {"3095", "CAJA-RURAL-SANROQUE", "BCOEESMM095"}},
    {"3096", {"3096", "CAIXA-RURAL-LALCUDIA", "BCOEESMM096"}},
    {"3098", {"3098", "CAJA-RURAL-NTRASEÑORAROSARIO", "BCOEESMM098"}},
    {"3102", {"3102", "CAIXA-SANTFERRER-DUIXO", "BCOEESMM102"}},
    {"3104", {"3104", "CAJA-RURAL-CANETETORRES", "BCOEESMM104"}},
    {"3105", {"3105", "CAIXA-RURAL-CALLOSA", "BCOEESMM105"}},
    {"3110", {"3110", "CAJA-RURAL-CATOLICOAGRARIA", "BCOESSMM110"}},
    {"3111", {"3111", "CAJA-RURAL-LAVALLSISIDRO", "BCOEESMM111"}},
    {"3112", {"3112", "CAJA-RURAL-SANJOSEBURRIANA", "BCOEESMM112"}},
    {"3113", {"3113", "CAJA-RURAL-SANJOSEALCORA", "BCOEESMM113"}},
    {"3115", {"3115", "CAJA-RURAL-MADRESOL", "BCOEESMM115"}},
    {"3116", {"3116", "CAJA-RURAL-MOTACUERVO", "BCOEESMM116"}},
    {"3117", {"3117", "CAIXA-RURAL-DALGEMESI", "BCOEESMM117"}},
    {"3118", {"3118", "CAIXA-RURAL-TORRENT", "BCOEESMM118"}},
    {"3119", {"3119", "CAJA-RURAL-SANJAIME", "BCOEESMM119"}},
    {"3121", {"3121", "CAJA-RURAL-CHESTE", "BCOEESMM121"}},
    {"3123", {"3123", "CAIXA-RURAL-TURIS", "BCOEESMM123"}},
    {"3127", {"3127", "CAJA-RURAL-CASASIBANEZ", "BCOEESMM127"}},
    {"3130", {"3130", "CAJA-RURAL-ALMASSORA", "BCOEESMM130"}},
    {"3134", {"3134", "CAJA-RURAL-SRAESPERANZA", "BCOEESMM134"}},
    {"3135", {"3135", "CAJA-RURAL-SANJOSENULES", "BCOEESMM135"}},
    {"3138", {"3138", "CAJA-RURAL-BETXI", "BCOEESMM138"}},
    {"3140", {"3140", "CAJA-RURAL-GUISSONA", "BCOEESMM140"}},
    {"3144", {"3144", "CAJA-RURAL-VILLAMALEA", "BCOEESMM144"}},
    {"3146", {"3146", "CAJA-CREDITO-COOPERATIVO", "CCCVESM1XXX"}},
    {"3150", {"3150", "CAJA-RURAL-ALBALCOOP", "BCOEESMM150"}},
    {"3152", {"3152", "CAJA-RURAL-VILLAR", "BCOEESMM152"}},
    {"3157", {"3157", "CAJA-RURAL-JUNQUERA", "BCOEESMM157"}},
    {"3159", {"3159", "CAIXA-POPULAR-SDADCOOP", "BCOEESMM159"}},
    {"3160", {"3160", "CAIXA-RURAL-SANTJOSEPCOOP", "BCOEESMM160"}},
    {"3162", {"3162", "CAJA-RURAL-BENICARLO", "BCOEESMM162"}},
    {"3165", {"3165", "CAJA-RURAL-SANISIDROVILAFAMES", "BCOEESMM165"}},
    {"3166", {"3166", "CAIXA-RURAL-LESCOVESVINROMAS", "BCOEESMM166"}},
    {"3174", {"3174", "CAIXA-RURAL-VINAROS", "BCOEESMM174"}},
    {"3179", {"3179", "CAJA-RURAL-ALGINET", "BCOEESMM179"}},
    {"3183", {"3183", "CAJA-ARQUITECTOS-COOP", "CASDESBBXXX"}},
    {"3186", {"3186", "CAIXA-RURAL-ALBALAT", "BCOEESMM186"}},
    {"3187", {"3187", "CAJA-RURAL-DELSUR", "BCOEESMM187"}},
    {"3190", {"3190", "CAJA-RURAL-ALBACETE", "BCOEESMM190"}},
    {"3191", {"3191", "CAJA-RURAL-ARAGON", "BCOEESMM191"}},
    {"9000", {"9000", "BANCO-DE-ESPANA", "ESPBESMMXXX"}},
  };
  return table;
}
// clang-format on

}  // namespace

const BankRegistry& BankRegistry::instance() {
  static const BankRegistry registry;
  return registry;
}

BankRegistry::BankRegistry() : banks_{bankTable()} {
  LOG_DEBUG(BANK_LOG, "bank registry loaded, banks: " << banks_.size());
}

const BankEntry* BankRegistry::find(const std::string& code) const {
  auto it = banks_.find(code);
  if (it == banks_.cend()) {
    return nullptr;
  }
  return &it->second;
}

bool BankRegistry::contains(const std::string& code) const { return find(code) != nullptr; }

std::size_t BankRegistry::size() const { return banks_.size(); }

const std::map<std::string, BankEntry>& BankRegistry::entries() const { return banks_; }

const BankEntry& BankRegistry::randomBank() const {
  auto it = std::next(banks_.cbegin(), static_cast<std::ptrdiff_t>(randomNumber(0, banks_.size() - 1)));
  return it->second;
}

}  // namespace masking::es
